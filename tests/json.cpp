#include "chunknet/json/Value.hpp"

#include <cassert>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace {

bool parse_fails(std::string_view text) {
    try {
        (void)chunknet::json::parse(text);
    } catch (const chunknet::json::ParseError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    using chunknet::json::Value;
    using chunknet::json::parse;
    using chunknet::json::serialize;

    const auto document = parse(R"({"name":"report.pdf","size":1024,"ratio":0.5,"ok":true,
                                    "holders":["node-a","node-b"],"nested":{"none":null}})");
    assert(document.is_object());
    assert(document.get_string("name") == std::optional<std::string>("report.pdf"));
    assert(document.get_int64("size") == std::optional<std::int64_t>(1024));
    assert(document.get_bool("ok") == std::optional<bool>(true));
    assert(document.find("ratio")->is_double());
    assert(document.find("holders")->as_array().size() == 2);
    assert(document.find("nested")->find("none")->is_null());
    assert(document.find("missing") == nullptr);
    assert(!document.get_string("size").has_value());

    // Keys serialize in sorted order.
    auto built = Value::make_object();
    built.set("b", Value(2));
    built.set("a", Value("x"));
    auto list = Value::make_array();
    list.push_back(Value(true));
    list.push_back(Value());
    built.set("c", std::move(list));
    assert(serialize(built) == R"({"a":"x","b":2,"c":[true,null]})");
    assert(parse(serialize(built)) == built);

    // Escapes and unicode.
    const auto text = parse(R"("line\nbreak \"quoted\" \u00e9 \ud83d\ude00")");
    assert(text.string_value == "line\nbreak \"quoted\" \xC3\xA9 \xF0\x9F\x98\x80");
    assert(parse("\"caf\xC3\xA9\"").string_value == "caf\xC3\xA9");
    assert(serialize(Value(std::string("tab\there"))) == R"("tab\there")");

    assert(parse("-42").integer_value == -42);
    assert(parse("1e3").is_double());
    assert(parse("  [ ]  ").as_array().empty());

    assert(parse_fails(""));
    assert(parse_fails("{"));
    assert(parse_fails("{\"a\" 1}"));
    assert(parse_fails("[1,]"));
    assert(parse_fails("tru"));
    assert(parse_fails("\"unterminated"));
    assert(parse_fails("{} trailing"));
    assert(parse_fails(std::string(300, '[')));

    return 0;
}
