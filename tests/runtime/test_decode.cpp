#include <cassert>
#include <map>
#include <string>
#include <vector>

#include <JsonCatchAll/codec.hpp>

#include "../test_model.hpp"

using namespace JsonCatchAll;
using namespace json_catch_all_test_models;

namespace {

std::map<std::string, std::string> entries(const AdditionalProperties & ap) {
    std::map<std::string, std::string> res;
    for(const auto & [k, v] : ap) {
        res[k] = v.bytes;
    }
    return res;
}

void unknown_keys_are_captured() {
    auto codec = makeCompatibleCodec();
    Named n;
    assert(codec->Parse(n, R"({"Name":"a","x":1,"y":2})"));
    assert(n.Name == "a");
    assert((entries(n.Extra) == std::map<std::string, std::string>{{"x", "1"}, {"y", "2"}}));

    // Nested values are kept byte for byte, whitespace included
    assert(codec->Parse(n, R"({"x" : [ 1, {"k" : null} ] , "Name":"b"})"));
    assert(n.Name == "b");
    assert(entries(n.Extra) == (std::map<std::string, std::string>{{"x", R"([ 1, {"k" : null} ])"}}));

    // Escapes inside captured strings are not decoded
    assert(codec->Parse(n, R"({"s":"aé\n"})"));
    assert(n.Extra->at("s").bytes == R"("aé\n")");

    assert(codec->Parse(n, R"({"n":null,"t":true})"));
    assert(n.Extra->at("n").bytes == "null");
    assert(n.Extra->at("t").bytes == "true");
}

void each_decode_starts_with_a_fresh_store() {
    auto codec = makeCompatibleCodec();
    Named n;
    n.Extra->emplace("stale", RawJson("1"));
    assert(codec->Parse(n, R"({"Name":"a"})"));
    assert(n.Extra->empty());

    assert(codec->Parse(n, R"({"fresh":2})"));
    assert(n.Extra->size() == 1);
    assert(n.Extra->count("fresh") == 1);
}

void duplicate_keys_last_wins() {
    auto codec = makeCompatibleCodec();
    Named n;
    assert(codec->Parse(n, R"({"x":1,"Name":"a","x":[2],"Name":"b"})"));
    assert(n.Name == "b");
    assert(n.Extra->at("x").bytes == "[2]");
}

void key_matching_is_case_insensitive_by_default() {
    auto codec = makeCompatibleCodec();
    Named n;
    assert(codec->Parse(n, R"({"name":"lower","NAME2":1})"));
    assert(n.Name == "lower");
    // The original spelling of unknown keys is preserved
    assert(n.Extra->count("NAME2") == 1);

    // An exact match is preferred over a folded one
    Person p;
    assert(codec->Parse(p, R"({"NAME":"folded","name":"exact"})"));
    assert(p.name == "exact");

    Config cfg;
    cfg.caseSensitive = true;
    Codec strict(cfg);
    registerAdditionalPropertiesExtension(strict);
    Named s;
    assert(strict.Parse(s, R"({"name":"lower"})"));
    assert(s.Name.empty());
    assert(s.Extra->at("name").bytes == R"("lower")");
}

void meta_described_records() {
    auto codec = makeCompatibleCodec();
    Person p;
    assert(codec->Parse(p, R"({"name":"n","age":41,"email":"e@x","phone":"123"})"));
    assert(p.name == "n");
    assert(p.age == 41);
    assert(p.email && *p.email == "e@x");
    assert(entries(p.extra) == (std::map<std::string, std::string>{{"phone", R"("123")"}}));

    assert(codec->Parse(p, R"({"email":null})"));
    assert(!p.email);
}

void null_leaves_a_record_untouched() {
    auto codec = makeCompatibleCodec();
    Named n;
    n.Name = "kept";
    n.Extra->emplace("k", RawJson("1"));
    assert(codec->Parse(n, "null"));
    assert(n.Name == "kept");
    assert(n.Extra->size() == 1);

    Outer o;
    o.Main.Id = "inner";
    assert(codec->Parse(o, R"({"Main":null,"Items":null})"));
    assert(o.Main.Id == "inner");
    assert(o.Items.empty());
}

void scalars_and_containers() {
    auto codec = makeCompatibleCodec();
    Scalars s;
    auto res = codec->Parse(s, R"({
        "Flag": true,
        "Count": -12,
        "Small": 200,
        "Ratio": 0.25,
        "Text": "t\"x",
        "Maybe": 5,
        "List": [1, 2, 3],
        "Counts": {"a": 1, "b": 2},
        "Labels": {"k": "v"},
        "Raw": {"keep" : "as is"}
    })");
    assert(res);
    assert(s.Flag);
    assert(s.Count == -12);
    assert(s.Small == 200);
    assert(s.Ratio == 0.25);
    assert(s.Text == "t\"x");
    assert(s.Maybe && *s.Maybe == 5);
    assert((s.List == std::vector<int>{1, 2, 3}));
    assert(s.Counts.size() == 2 && s.Counts.at("b") == 2);
    assert(s.Labels.at("k") == "v");
    assert(s.Raw.bytes == R"({"keep" : "as is"})");

    // Unknown keys of a record without a catch-all are skipped
    Plain p;
    assert(codec->Parse(p, R"({"Name":"a","other":{"deep":[1,2]},"Count":3})"));
    assert(p.Name == "a");
    assert(p.Count == 3);

    Ignoring ig;
    assert(codec->Parse(ig, R"({"Name":"a","Hidden":5,"renamed":7})"));
    assert(ig.Hidden.get() == 0);
    assert(ig.Count.get() == 7);
}

void decode_errors() {
    auto codec = makeCompatibleCodec();
    {
        Named n;
        std::string_view in = R"({"Name":"a","x":})";
        auto res = codec->Parse(n, in);
        assert(!res);
        assert(res.error() == ParseError::READER_ERROR);
        assert(res.readerError() == JsonIteratorReaderError::ILLFORMED_OBJECT);
        assert(res.offset() == 16);
    }
    {
        Named n;
        auto res = codec->Parse(n, R"({"Name":5})");
        assert(!res);
        assert(res.error() == ParseError::NON_STRING_IN_STRING_STORAGE);
        assert(res.offset() == 8);
    }
    {
        Scalars s;
        assert(codec->Parse(s, R"({"Count":null})").error() == ParseError::NULL_IN_NON_OPTIONAL);
        assert(codec->Parse(s, R"({"Count":"1"})").error() == ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE);
        assert(codec->Parse(s, R"({"Flag":1})").error() == ParseError::NON_BOOL_IN_BOOL_VALUE);
        assert(codec->Parse(s, R"({"List":{}})").error() == ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE);
        assert(codec->Parse(s, R"({"Labels":[]})").error() == ParseError::NON_MAP_IN_MAP_LIKE_VALUE);

        auto range = codec->Parse(s, R"({"Small":256})");
        assert(range.error() == ParseError::READER_ERROR);
        assert(range.readerError() == JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
    }
    {
        Named n;
        auto res = codec->Parse(n, R"({"Name":"a"} x)");
        assert(res.readerError() == JsonIteratorReaderError::EXCESS_CHARACTERS);
    }
    {
        Named n;
        assert(codec->Parse(n, "[]").error() == ParseError::NON_MAP_IN_MAP_LIKE_VALUE);
        assert(codec->Parse(n, R"({"Name":"a")").readerError() == JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
    }
}

void unknown_fields_can_be_rejected() {
    Config cfg;
    cfg.disallowUnknownFields = true;
    Codec codec(cfg);
    registerAdditionalPropertiesExtension(codec);

    Plain p;
    auto res = codec.Parse(p, R"({"Name":"a","other":1})");
    assert(!res);
    assert(res.error() == ParseError::EXCESS_FIELD);

    // A catch-all still accepts them
    Named n;
    assert(codec.Parse(n, R"({"Name":"a","other":1})"));
    assert(n.Extra->at("other").bytes == "1");
}

void nesting_limit() {
    Config cfg;
    cfg.maxDepth = 2;
    Codec codec(cfg);
    registerAdditionalPropertiesExtension(codec);

    std::vector<std::vector<std::vector<int>>> v;
    auto res = codec.Parse(v, "[[[1]]]");
    assert(!res);
    assert(res.error() == ParseError::NESTING_TOO_DEEP);

    std::vector<std::vector<int>> ok;
    assert(codec.Parse(ok, "[[1]]"));

    Named n;
    auto captured = codec.Parse(n, R"({"x":[[[1]]]})");
    assert(!captured);
    assert(captured.readerError() == JsonIteratorReaderError::SKIPPING_STACK_OVERFLOW);
}


void long_numbers_in_unknown_values() {
    auto codec = makeCompatibleCodec();
    const std::string big(100, '7');
    const std::string decimal = "-0." + std::string(80, '3') + "E+12";

    Named n;
    std::string in = R"({"Name":"a","big":)" + big + R"(,"pi":[)" + decimal + "]}";
    auto res = codec->Parse(n, in);
    assert(res);
    assert(n.Extra->at("big").bytes == big);
    assert(n.Extra->at("pi").bytes == "[" + decimal + "]");

    // Dropped when there is nowhere to keep them
    Plain p;
    assert(codec->Parse(p, R"({"Name":"p","big":)" + big + R"(,"Count":2})"));
    assert(p.Name == "p");
    assert(p.Count == 2);
}

} // namespace

int main() {
    unknown_keys_are_captured();
    each_decode_starts_with_a_fresh_store();
    duplicate_keys_last_wins();
    key_matching_is_case_insensitive_by_default();
    meta_described_records();
    null_leaves_a_record_untouched();
    scalars_and_containers();
    decode_errors();
    unknown_fields_can_be_rejected();
    nesting_limit();
    long_numbers_in_unknown_values();
    return 0;
}
