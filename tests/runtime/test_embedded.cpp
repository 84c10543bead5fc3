#include <cassert>
#include <string>
#include <vector>

#include <JsonCatchAll/codec.hpp>

#include "../test_model.hpp"

using namespace JsonCatchAll;
using namespace json_catch_all_test_models;

namespace {

std::vector<std::string> fieldNames(const StructDescriptor & desc) {
    std::vector<std::string> res;
    for(const FieldBinding & f : desc.fields) {
        res.push_back(f.name());
    }
    return res;
}

void promoted_fields_and_shadowing() {
    auto codec = makeCompatibleCodec();
    Derived d;
    assert(codec->Parse(d, R"({"id":"x","kind":"k","level":0,"other":true})"));
    assert(d.base.id == "x");
    assert(d.kind == "k");
    // Base::kind is shadowed by Derived::kind
    assert(d.base.kind.empty());
    assert(d.level == 0);
    // The embedded record's catch-all is used
    assert(d.base.extra.at("other").bytes == "true");

    std::string out;
    assert(codec->Serialize(d, out));
    assert(out == R"({"id":"x","kind":"k","other":true})");

    // Derived::kind has no omitempty, although Base::kind does
    Derived blank;
    blank.base.id = "y";
    assert(codec->Serialize(blank, out));
    assert(out == R"({"id":"y","kind":""})");

    const StructDescriptor & desc = codec->registry().get<Derived>();
    assert((fieldNames(desc) == std::vector<std::string>{"id", "kind", "level"}));
    assert(desc.additional.has_value());
}

void own_catch_all_wins_over_embedded() {
    auto codec = makeCompatibleCodec();
    Derived2 d;
    assert(codec->Parse(d, R"({"id":"i","z":1})"));
    assert(d.base.id == "i");
    assert(d.own.at("z").bytes == "1");
    assert(d.base.extra.empty());

    std::string out;
    assert(codec->Serialize(d, out));
    assert(out == R"({"id":"i","z":1})");

    const StructDescriptor & desc = codec->registry().get<Derived2>();
    assert((fieldNames(desc) == std::vector<std::string>{"id", "kind"}));
}

void embedded_type_is_built_once() {
    auto codec = makeCompatibleCodec();
    Derived d;
    Derived2 d2;
    Base b;
    assert(codec->Parse(d, "{}"));
    assert(codec->Parse(d2, "{}"));
    assert(codec->Parse(b, R"({"id":"b","q":[]})"));
    assert(b.extra.at("q").bytes == "[]");
    assert(codec->registry().size() == 3);
    assert(codec->registry().constructions() == 3);
}


void omit_empty_table_follows_declaration_order() {
    auto codec = makeCompatibleCodec();
    KindFirst k;
    k.base.id = "z";
    std::string out;
    // Base's "kind,omitempty" is merged after KindFirst::kind and overwrites its flag
    assert(codec->Serialize(k, out));
    assert(out == R"({"id":"z"})");

    k.kind = "k2";
    assert(codec->Serialize(k, out));
    assert(out == R"({"kind":"k2","id":"z"})");

    // The own field still shadows the promoted one on input
    assert(codec->Parse(k, R"({"kind":"x","id":"y"})"));
    assert(k.kind == "x");
    assert(k.base.kind.empty());
}

} // namespace

int main() {
    promoted_fields_and_shadowing();
    own_catch_all_wins_over_embedded();
    embedded_type_is_built_once();
    omit_empty_table_follows_declaration_order();
    return 0;
}
