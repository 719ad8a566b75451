#include <cassert>
#include <iostream>
#include "tailrec/edn.hpp"
#include "tailrec/diagnostics.hpp"
#include "tailrec/forms.hpp"
#include "tailrec/transform.hpp"
#include "test_env.hpp"

using namespace tailrec;

static void test_json_escape(){
    assert(json_escape("plain") == "\"plain\"");
    assert(json_escape("a\"b\\c") == "\"a\\\"b\\\\c\"");
    assert(json_escape("x\ny\tz") == "\"x\\ny\\tz\"");
    assert(json_escape(std::string("\x01", 1)) == "\"\\u0001\"");
}

static void test_json_shape(){
    auto r = transform_function(parse("(fn :params [] :body (block))"), TransformOptions{});
    assert(!r.diags.success);
    auto js = diagnostics_to_json(r.diags);
    assert(js ==
        "{\"success\":false,\"errors\":[{\"code\":\"E1001\",\"message\":\"fn missing :name\","
        "\"hint\":\"add :name <symbol>\",\"line\":1,\"col\":1,\"notes\":[]}],\"warnings\":[]}");

    Diagnostics empty;
    assert(diagnostics_to_json(empty) == "{\"success\":true,\"errors\":[],\"warnings\":[]}");
}

static void test_notes_and_text(){
    Diagnostics d;
    ErrorReporter rep{&d};
    auto at = parse("(fn :name f\n  :body 5)");
    rep.warning("W1101", "no tail call", "", at);
    rep.note("declared here", kw_value(at, "body"));
    rep.error("E1005", "bad body", "wrap it", at);
    rep.note("body is here", kw_value(at, "body"));
    assert(!d.success);
    assert(d.errors[0].notes.size() == 1 && d.errors[0].notes[0].line == 2);
    // a note goes to the latest error, or to the latest warning when there are no errors
    assert(d.warnings[0].notes.size() == 1);

    auto text = format_diagnostics(d);
    assert(text.find("error[E1005]: bad body (line 1:1)\n  hint: wrap it\n  note: body is here (line 2:9)\n") == 0);
    assert(text.find("warning[W1101]: no tail call (line 1:1)\n") != std::string::npos);

    auto js = diagnostics_to_json(d);
    assert(js.find("\"notes\":[{\"message\":\"body is here\",\"line\":2,\"col\":9}]") != std::string::npos);
}

static void test_merge(){
    Diagnostics a, b;
    ErrorReporter ra{&a}, rb{&b};
    ra.warning("W1100", "w", "", nullptr);
    rb.error("E1000", "e", "", nullptr);
    merge(a, b);
    assert(!a.success);
    assert(a.errors.size() == 1 && a.warnings.size() == 1);
    assert(a.errors[0].line == -1);
    // positionless entries print without a location
    assert(format_diagnostics(a).find("error[E1000]: e\n") == 0);
}

void run_diagnostics_tests(){
    test_json_escape();
    test_json_shape();
    test_notes_and_text();
    test_merge();
    std::cout << "Diagnostics tests passed\n";
}
