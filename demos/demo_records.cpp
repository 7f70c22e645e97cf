// demo_records.cpp
//
// Round-trips a small TOML document whose `id` fields are Crockford UUIDs
// through the toml++ hook adapters, then feeds it a malformed record to show
// how codec failures surface as Validation errors.

#include <cuuid/hooks.hpp>
#include <cuuid/log.hpp>

#include <iostream>
#include <sstream>
#include <string>

using namespace cuuid;

struct Record {
    Uuid id;
    std::string name;
};

static toml::table to_table(const Record& r) {
    toml::table tbl;
    write_uuid(tbl, "id", r.id);
    tbl.insert_or_assign("name", r.name);
    return tbl;
}

static Result<Record> from_table(const toml::table& tbl) {
    auto id = read_uuid(tbl, "id");
    CUUID_TRY(id);
    auto name = tbl["name"].value<std::string>();
    if (!name) {
        return CuuidError{CuuidError::Validation, "missing required field 'name'"};
    }
    return Result<Record>::ok(Record{id.value(), *name});
}

static Result<Record> parse_record(const std::string& text) {
    toml::table tbl;
    try {
        tbl = toml::parse(text);
    } catch (const toml::parse_error& e) {
        return CuuidError{CuuidError::Parse, std::string("record parse error: ") + e.what()};
    }
    return from_table(tbl);
}

int main() {
    log::set_level(log::Debug);

    Record original{Uuid::generate_ordered(), "example"};
    std::ostringstream out;
    out << to_table(original);
    std::cout << out.str() << "\n";

    auto back = parse_record(out.str());
    if (back.is_err()) {
        std::cerr << back.error().format() << "\n";
        return 1;
    }
    log::info("round trip %s", back.value().id == original.id ? "ok" : "MISMATCH");

    for (const char* bad : {"id = \"not-a-uuid\"\nname = \"x\"",
                            "id = 42\nname = \"x\""}) {
        auto r = parse_record(bad);
        if (r.is_err()) {
            std::cerr << r.error().format() << "\n";
        }
    }
    return back.value().id == original.id ? 0 : 1;
}
