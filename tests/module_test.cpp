#include <catch2/catch.hpp>
#include "errors.hpp"
#include "module.hpp"

using namespace nlpq;

TEST_CASE("Builtin registry knows its modules", "[modules]") {
    ModuleRegistry modules = builtin_modules();
    REQUIRE(modules.names() == std::vector<std::string>{"echo", "upper", "wordcount"});
    REQUIRE(modules.find("upper"));
    REQUIRE_FALSE(modules.find("frog"));
    try {
        modules.get("frog");
        FAIL("unknown module should throw");
    } catch (const QueueError& e) {
        REQUIRE(e.kind() == ErrorKind::UnknownModule);
    }
}

TEST_CASE("Upper and echo modules", "[modules]") {
    ModuleRegistry modules = builtin_modules();
    REQUIRE(modules.get("upper").process("Hello, world") == "HELLO, WORLD");
    REQUIRE(modules.get("echo").process("as is") == "as is");
    REQUIRE(modules.get("echo").convert("x", "json") == R"({"text":"x"})");
}

TEST_CASE("Wordcount produces csv and converts to json", "[modules]") {
    ModuleRegistry modules = builtin_modules();
    const Module& wc = modules.get("wordcount");

    std::string csv = wc.process("The cat saw the dog.");
    REQUIRE(csv == "word,count\ncat,1\ndog,1\nsaw,1\nthe,2\n");
    REQUIRE(wc.convert(csv, "csv") == csv);
    REQUIRE(wc.convert(csv, "json") == R"({"cat":1,"dog":1,"saw":1,"the":2})");

    try {
        wc.convert(csv, "xml");
        FAIL("unsupported format should throw");
    } catch (const QueueError& e) {
        REQUIRE(e.kind() == ErrorKind::BadRequest);
    }
}

TEST_CASE("Wordcount json conversion rejects text that is not a count table", "[modules]") {
    ModuleRegistry modules = builtin_modules();
    const Module& wc = modules.get("wordcount");

    for (const std::string bad : {"just some prose", "word,count\ncat,many\n", "word,count\ncat\n"}) {
        try {
            wc.convert(bad, "json");
            FAIL("malformed wordcount result should throw");
        } catch (const QueueError& e) {
            REQUIRE(e.kind() == ErrorKind::BadRequest);
        }
    }
    REQUIRE(wc.convert("word,count\n", "json") == "{}");
}
