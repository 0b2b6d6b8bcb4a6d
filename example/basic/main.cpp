// main.cpp
// protodict Example - building, serializing and reading back typed containers
//
// Walks through the main entry points:
//
// Part 1: OrderedMap built from keywords and plain values
// Part 2: TypedSequence with a declared element type
// Part 3: Lenient classification of a type protodict does not know
// Part 4: EmbeddedValue keeping a value's age across the wire

#include <protodict/domain_types.h>
#include <protodict/embedded_value.h>
#include <protodict/errors.h>
#include <protodict/ordered_map.h>
#include <protodict/typed_sequence.h>
#include <protodict/wire_codec.h>

#include <any>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace protodict;

namespace {

void demo_ordered_map()
{
    std::cout << "=== Part 1: OrderedMap ===\n";

    OrderedMap args{{"path", "/etc"}, {"recursive", true}, {"depth", 3}};
    args.set("pathtype", std::make_shared<UrnValue>("aff4:/C.1000/fs/os/"));
    args.set("extensions", std::vector<std::string>{".conf", ".d"});

    ByteBuffer bytes = args.serialize();
    std::cout << "encoded " << args.size() << " entries into " << bytes.size() << " bytes\n";

    OrderedMap back = OrderedMap::deserialize(bytes);
    for (const auto& [key, value] : back.items()) {
        std::cout << "  " << key << " = " << value.to_string() << "\n";
    }
    std::cout << "round trip equal: " << std::boolalpha << (back == args) << "\n\n";

    print_value(back.to_typed_value(), "", 1);
    std::cout << "\n";
}

void demo_typed_sequence()
{
    std::cout << "=== Part 2: TypedSequence ===\n";

    auto names = TypedSequence::of<StringValue>();
    names.append("hello").append("world").append("!");

    try {
        names.append(TimestampValue::now());
    } catch (const ValueError& e) {
        std::cout << "rejected: " << e.what() << "\n";
    }

    std::cout << "pop() -> " << names.pop().to_string() << "\n";
    std::cout << "pop(1) -> " << names.pop(1).to_string() << "\n";
    std::cout << "pop() -> " << names.pop().to_string() << "\n";
    std::cout << "empty: " << std::boolalpha << names.empty() << "\n\n";
}

void demo_lenient()
{
    std::cout << "=== Part 3: Lenient classification ===\n";

    std::vector<std::any> mixture{1, std::this_thread::get_id(), 3};

    try {
        (void)classify(mixture);
    } catch (const TypeError& e) {
        std::cout << "strict: " << e.what() << "\n";
    }

    Object back = materialize(classify(mixture, ClassifyMode::Lenient));
    std::cout << "lenient: " << back.to_string() << "\n\n";
}

void demo_embedded()
{
    std::cout << "=== Part 4: EmbeddedValue ===\n";

    TypedSequence results{"file1", "file2"};
    std::cout << "age before: " << format_timestamp(results.age()) << "\n";

    EmbeddedValue wrapped = EmbeddedValue::wrap(results);
    EmbeddedValue restored = EmbeddedValue::deserialize(wrapped.serialize());
    TypedSequence back = restored.unwrap_sequence();

    std::cout << "age after:  " << format_timestamp(back.age()) << "\n";
    std::cout << "same age: " << std::boolalpha << (back.age() == results.age()) << "\n";
}

} // anonymous namespace

int main()
{
    try {
        demo_ordered_map();
        demo_typed_sequence();
        demo_lenient();
        demo_embedded();
    } catch (const Error& e) {
        std::cerr << "protodict error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
