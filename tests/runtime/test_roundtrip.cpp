#include <cassert>
#include <string>
#include <string_view>

#include <JsonCatchAll/codec.hpp>

#include "../test_model.hpp"

using namespace JsonCatchAll;
using namespace json_catch_all_test_models;

namespace {

template<class T>
std::string reencode(Codec & codec, std::string_view in) {
    T obj;
    auto parsed = codec.Parse(obj, in);
    assert(parsed);
    std::string out;
    auto written = codec.Serialize(obj, out);
    assert(written);
    return out;
}

void unknown_keys_survive_a_round_trip() {
    auto codec = makeCompatibleCodec();
    // Extras come back after the typed fields, sorted, with their bytes untouched
    assert(reencode<Named>(*codec, R"({"Name":"a","b":{"c": [1, 2, {"d": null}]},"a":"sé"})")
           == R"({"Name":"a","a":"sé","b":{"c": [1, 2, {"d": null}]}})");

    // Whitespace outside captured values is not preserved
    assert(reencode<Named>(*codec, "{ \"z\" : 1 ,\n \"Name\" : \"n\" }") == R"({"Name":"n","z":1})");
}

void nested_records_keep_their_own_extras() {
    auto codec = makeCompatibleCodec();
    std::string_view in =
        R"({"Title":"t","Main":{"Id":"m","u":1},"Items":[{"Id":"i1"},{"Id":"i2","v":[true]}],"w":"x"})";

    Outer o;
    assert(codec->Parse(o, in));
    assert(o.Main.Id == "m");
    assert(o.Main.Extra->at("u").bytes == "1");
    assert(o.Items.size() == 2);
    assert(o.Items[0].Extra->empty());
    assert(o.Items[1].Extra->at("v").bytes == "[true]");
    assert(o.Extra->size() == 1);
    assert(o.Extra->at("w").bytes == R"("x")");

    assert(reencode<Outer>(*codec, in) == in);
}

void meta_records_round_trip() {
    auto codec = makeCompatibleCodec();
    assert(reencode<Person>(*codec, R"({"name":"n","tags":["a","b"],"age":0})")
           == R"({"name":"n","tags":["a","b"]})");
}


void long_numbers_round_trip() {
    auto codec = makeCompatibleCodec();
    const std::string big(100, '9');
    const std::string decimal = "3." + std::string(70, '1') + "e-300";
    std::string in = R"({"Name":"n","big":)" + big + R"(,"pi":)" + decimal + "}";
    assert(reencode<Named>(*codec, in) == in);
}

} // namespace

int main() {
    unknown_keys_survive_a_round_trip();
    nested_records_keep_their_own_extras();
    meta_records_round_trip();
    long_numbers_round_trip();
    return 0;
}
