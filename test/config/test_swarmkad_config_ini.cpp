#include <swarmkad/config/ini.hpp>

#include <catch2/catch.hpp>

#include <fstream>

TEST_CASE("ConfigParser", "[config]")
{
    swarmkad::ConfigParser parser;

    SECTION("Parse empty")
    {
        REQUIRE(parser.load_from_str(""));
    }

    SECTION("Parse one section")
    {
        swarmkad::ConfigParser::SectionValues sect;
        // this is an anti pattern don't write this kind of code with configpaser
        auto assertVisit = [&sect](const auto& section) -> bool {
            sect = section;
            return true;
        };
        REQUIRE(parser.load_from_str("[test]\nkey=val   \n"));
        REQUIRE(parser.visit_section("test", assertVisit));
        auto itr = sect.find("notfound");
        REQUIRE(itr == sect.end());
        itr = sect.find("key");
        REQUIRE(itr != sect.end());
        REQUIRE(itr->second == "val");
    }

    SECTION("Parse section duplicate keys")
    {
        REQUIRE(parser.load_from_str("[test]\nkey1=val1\nkey1=val2"));
        size_t num = 0;
        auto visit = [&num](const auto& section) -> bool {
            num = section.count("key1");
            return true;
        };
        REQUIRE(parser.visit_section("test", visit));
        REQUIRE(num == size_t(2));
    }

    SECTION("Comments and blank lines")
    {
        REQUIRE(parser.load_from_str("# leading\n\n[test]\n; note\n  key = val\r\n"));
        std::string value;
        REQUIRE(parser.visit_section("test", [&value](const auto& section) {
            value = section.find("key")->second;
            return true;
        }));
        REQUIRE(value == "val");
    }

    SECTION("Inline comments")
    {
        REQUIRE(parser.load_from_str("[test]\nkey=val  # trailing note\nother=x ; note\nhash=a#b\n"));
        swarmkad::ConfigParser::SectionValues sect;
        REQUIRE(parser.visit_section("test", [&sect](const auto& section) {
            sect = section;
            return true;
        }));
        REQUIRE(sect.find("key")->second == "val");
        REQUIRE(sect.find("other")->second == "x");
        // a marker not preceded by whitespace is part of the value
        REQUIRE(sect.find("hash")->second == "a#b");
    }

    SECTION("Reload replaces contents")
    {
        REQUIRE(parser.load_from_str("[first]\nkey=val\n"));
        REQUIRE(parser.load_from_str("[second]\nkey=val\n"));
        REQUIRE_FALSE(parser.visit_section("first", [](const auto&) { return true; }));
        REQUIRE(parser.visit_section("second", [](const auto&) { return true; }));
    }

    SECTION("Missing section")
    {
        REQUIRE(parser.load_from_str("[test]\nkey=val\n"));
        REQUIRE_FALSE(parser.visit_section("other", [](const auto&) { return true; }));
    }

    SECTION("No key")
    {
        REQUIRE_FALSE(parser.load_from_str("[test]\n=1090\n"));
    }

    SECTION("Parse invalid")
    {
        REQUIRE_FALSE(parser.load_from_str("srged5ghe5\nf34wtge5\nw34tgfs4ygsd5yg=4;\n#g4syhgd5\n"));
    }

    SECTION("Missing file")
    {
        REQUIRE_FALSE(parser.load_file("/nonexistent/swarmkad.ini"));
    }

    SECTION("Empty file")
    {
        const auto path = fs::temp_directory_path() / "swarmkad_ini_empty.ini";
        std::ofstream{path}.close();
        REQUIRE(parser.load_file(path));
        REQUIRE_FALSE(parser.visit_section("test", [](const auto&) { return true; }));
        fs::remove(path);
    }
}
