// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Example usage of the sift library
//
// This example demonstrates basic usage of the library:
// - Decoding a whole document
// - Extracting one value with a JSON pointer
// - Chaining lazy queries and reading typed values
// - Error handling
//
// Run with a file name (and optionally a pointer) to query a file:
//
//     sift_example data.json /users/0/email

#include "../sift.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

static const char kStore[] = R"({
    "store": {
        "name": "Corner Books",
        "open": true,
        "rating": 4.5,
        "manager": null,
        "books": [
            {"title": "Sayings of the Century", "price": 8.95, "stock": 12},
            {"title": "Sword of Honour", "price": 12.99, "stock": 0},
            {"title": "Moby Dick", "price": 8.99, "stock": 3}
        ],
        "a/b": "slash key",
        "m~n": "tilde key"
    }
})";

static void
print_value(const sift::Value& value, int indent = 0)
{
    std::string pad(indent * 2, ' ');
    switch (value.getType()) {
        case sift::Value::Null:
            std::cout << "null";
            break;
        case sift::Value::Bool:
            std::cout << (value.getBool() ? "true" : "false");
            break;
        case sift::Value::Long:
            std::cout << value.getLong();
            break;
        case sift::Value::Double:
            std::cout << value.getDouble();
            break;
        case sift::Value::String:
            std::cout << '"' << value.getString() << '"';
            break;
        case sift::Value::Array:
            std::cout << "[\n";
            for (const sift::Value& item : value.getArray()) {
                std::cout << pad << "  ";
                print_value(item, indent + 1);
                std::cout << "\n";
            }
            std::cout << pad << "]";
            break;
        case sift::Value::Object:
            std::cout << "{\n";
            for (const auto& member : value.getObject()) {
                std::cout << pad << "  " << member.first << ": ";
                print_value(member.second, indent + 1);
                std::cout << "\n";
            }
            std::cout << pad << "}";
            break;
    }
}

// Example 1: Decode a whole document
void example_decode()
{
    std::cout << "\n=== Example 1: Decoding JSON ===" << std::endl;

    sift::Value doc = sift::decode(kStore);
    const sift::Value* store = doc.find("store");
    std::cout << "Store has " << store->size() << " members and "
              << store->find("books")->size() << " books" << std::endl;
    print_value(*store->find("books"));
    std::cout << std::endl;
}

// Example 2: Extract a single value with a JSON pointer
void example_pointer()
{
    std::cout << "\n=== Example 2: JSON Pointer ===" << std::endl;

    std::cout << "/store/books/1/title = "
              << sift::getByPointer(kStore, "/store/books/1/title").getString()
              << std::endl;
    std::cout << "/store/a~1b = "
              << sift::getByPointer(kStore, "/store/a~1b").getString()
              << std::endl;
    std::cout << "/store/m~0n = "
              << sift::getByPointer(kStore, "/store/m~0n").getString()
              << std::endl;
}

// Example 3: Lazy queries
void example_query()
{
    std::cout << "\n=== Example 3: Lazy Queries ===" << std::endl;

    sift::Query root = sift::query(kStore);
    sift::Query books = root.get("store").get("books");

    // Navigation records steps; the document is only walked on access.
    for (long long i = 0; i < 3; ++i) {
        sift::Query book = books.index(i);
        std::cout << "  " << book.get("title").getString() << ": $"
                  << book.get("price").getDouble() << " ("
                  << book.get("stock").getLong() << " in stock)" << std::endl;
    }

    sift::Query store = root.pointer("/store");
    std::cout << "open is " << store.get("open").typeName() << ", rating is "
              << store.get("rating").typeName() << ", manager is "
              << store.get("manager").typeName() << std::endl;
    std::cout << "manager isNull: " << (store.get("manager").isNull() ? "yes" : "no")
              << std::endl;
    std::cout << "raw second book: " << books.index(1).raw() << std::endl;
}

// Example 4: Error handling
void example_error_handling()
{
    std::cout << "\n=== Example 4: Error Handling ===" << std::endl;

    const char* bad_documents[] = {
        R"({"key": "value")",
        R"({"a": 1, "b": 2,})",
        R"([1, 2] 3)",
    };
    for (const char* json : bad_documents) {
        std::cout << "isValid(" << json << ") = "
                  << (sift::isValid(json) ? "true" : "false") << std::endl;
        try {
            sift::decode(json);
        } catch (const sift::Error& e) {
            std::cout << "  " << sift::Error::KindToString(e.kind()) << ": "
                      << e.what() << std::endl;
        }
    }

    sift::Query store = sift::query(kStore).get("store");
    try {
        store.get("missing").getString();
    } catch (const sift::Error& e) {
        std::cout << "missing key -> " << e.what() << std::endl;
    }
    try {
        store.get("name").getLong();
    } catch (const sift::Error& e) {
        std::cout << "wrong type -> " << e.what() << std::endl;
    }
    try {
        store.get("books").index(-1);
    } catch (const sift::Error& e) {
        std::cout << "negative index -> " << e.what() << std::endl;
    }
    try {
        store.pointer("books/0");
    } catch (const sift::Error& e) {
        std::cout << "bad pointer -> " << e.what() << std::endl;
    }
}

static std::string
read_file(const char* path)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
        throw sift::Error(sift::Error::IoError,
                          sift::io_error,
                          std::string("Cannot read file: ") + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        throw sift::Error(sift::Error::IoError,
                          sift::io_error,
                          std::string("Failed while reading file: ") + path);
    return ss.str();
}

static int
query_file(const char* path, const char* pointer)
{
    try {
        std::string json = read_file(path);
        sift::Query q = sift::query(std::move(json)).pointer(pointer);
        std::cout << q.typeName() << std::endl;
        print_value(q.value());
        std::cout << std::endl;
        return 0;
    } catch (const sift::Error& e) {
        std::cerr << path << ": " << e.what() << std::endl;
        return 1;
    }
}

int main(int argc, char* argv[])
{
    if (argc > 1)
        return query_file(argv[1], argc > 2 ? argv[2] : "");

    std::cout << "sift Example Program" << std::endl;
    std::cout << "====================" << std::endl;

    example_decode();
    example_pointer();
    example_query();
    example_error_handling();

    std::cout << "\nAll examples completed!" << std::endl;
    return 0;
}
