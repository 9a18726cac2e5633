#include "utils.hpp"

namespace refit::test {
    using namespace std::string_view_literals;

    namespace detail {
        // Workspace with a.cpp, box.hpp and use.cpp, loaded once.
        struct command_fixture {
            temp_dir temp{"refit_007_commands"};
            std::unique_ptr<test_session> ts{};
            std::unique_ptr<workspace> ws{};
            std::unique_ptr<snapshot> snap{};

            command_fixture() {
                write_text_file(temp.path / "a.cpp", "int a;\nint b;\n");
                write_text_file(temp.path / "box.hpp", "struct box {\n    int w;\n};\n");
                write_text_file(
                        temp.path / "use.cpp", "int use() { return a + sizeof(\"a\"); }  // a\n");
                ts = std::make_unique<test_session>(temp.path);
                ws = std::make_unique<workspace>(ts->s);
                snap = ws->load();
                REQUIRE(snap->errors() == 0U);
            }

            std::string file(std::string_view path) const { return snap->current_files().at(std::string{path}); }
        };
    }  // namespace detail

    TEST_CASE("007: default registry", "[007][commands]") {
        auto registry = default_commands();

        CHECK(registry.size() == 5U);
        CHECK(registry.names() == std::vector<std::string>{"add", "debug", "ex", "mv", "rm"});
        CHECK(registry.contains("mv"));
        CHECK(registry.find("inline") == nullptr);

        CHECK_THROWS_AS(registry.add("mv", commands::mv), std::invalid_argument);
        CHECK_THROWS_AS(registry.add("", commands::mv), std::invalid_argument);
        CHECK_THROWS_AS(registry.add("noop", command_handler{}), std::invalid_argument);
    }

    TEST_CASE("007: debug sets session options", "[007][commands]") {
        detail::command_fixture fx{};

        commands::debug(*fx.snap, "trace load=2 off="sv);

        const auto& s = fx.snap->session();
        CHECK(s.debug.at("trace") == "1");
        CHECK(s.debug.at("load") == "2");
        CHECK(s.debugging("trace"));
        CHECK_FALSE(s.debugging("off"));
        CHECK_FALSE(s.debugging("missing"));
        CHECK(fx.snap->errors() == 0U);
    }

    TEST_CASE("007: add appends to files and creates new ones", "[007][commands]") {
        detail::command_fixture fx{};

        commands::add(*fx.snap, "a.cpp int c;"sv);
        commands::add(*fx.snap, "extra.cpp int e;\nint f;"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("a.cpp") == "int a;\nint b;\n\nint c;\n");
        CHECK(fx.file("extra.cpp") == "int e;\nint f;\n");
    }

    TEST_CASE("007: add inserts after the enclosing top-level declaration", "[007][commands]") {
        detail::command_fixture fx{};

        commands::add(*fx.snap, "a int mid;"sv);
        commands::add(*fx.snap, "box.w int after;"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("a.cpp") == "int a;\n\nint mid;\nint b;\n");
        CHECK(fx.file("box.hpp") == "struct box {\n    int w;\n};\n\nint after;\n");
    }

    TEST_CASE("007: add reports bad arguments", "[007][commands]") {
        detail::command_fixture fx{};

        commands::add(*fx.snap, "a.cpp"sv);
        commands::add(*fx.snap, "nowhere int x;"sv);

        REQUIRE(fx.snap->errors() == 2U);
        CHECK(fx.snap->diagnostics()[0].message == "usage: add <file|item> text");
        CHECK(fx.snap->diagnostics()[1].message == "unknown file or item nowhere");
        CHECK_FALSE(fx.snap->modified());
    }

    TEST_CASE("007: rm deletes declarations with their lines", "[007][commands]") {
        detail::command_fixture fx{};

        commands::rm(*fx.snap, "b box.w b"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("a.cpp") == "int a;\n");
        CHECK(fx.file("box.hpp") == "struct box {\n};\n");
    }

    TEST_CASE("007: rm of an enclosing item covers its members", "[007][commands]") {
        detail::command_fixture fx{};

        commands::rm(*fx.snap, "box.w box"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("box.hpp").empty());
    }

    TEST_CASE("007: rm keeps neighbours on the same line", "[007][commands]") {
        detail::temp_dir temp{"refit_007_rm_line"};
        detail::write_text_file(temp.path / "p.cpp", "int p; int q;\n");
        detail::test_session ts{temp.path};
        workspace ws{ts.s};
        auto snap = ws.load();

        commands::rm(*snap, "q"sv);

        CHECK(snap->current_files().at("p.cpp") == "int p; \n");
    }

    TEST_CASE("007: rm reports unknown items", "[007][commands]") {
        detail::command_fixture fx{};

        commands::rm(*fx.snap, "ghost"sv);
        commands::rm(*fx.snap, ""sv);

        REQUIRE(fx.snap->errors() == 2U);
        CHECK(fx.snap->diagnostics()[0].message == "unknown item ghost");
        CHECK(fx.snap->diagnostics()[1].message == "usage: rm item...");
    }

    TEST_CASE("007: mv renames every code occurrence", "[007][commands]") {
        detail::command_fixture fx{};

        commands::mv(*fx.snap, "a alpha"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("a.cpp") == "int alpha;\nint b;\n");
        // literals and comments are left alone
        CHECK(fx.file("use.cpp") == "int use() { return alpha + sizeof(\"a\"); }  // a\n");
    }

    TEST_CASE("007: mv renames members within their scope", "[007][commands]") {
        detail::command_fixture fx{};

        commands::mv(*fx.snap, "box.w box.width"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("box.hpp") == "struct box {\n    int width;\n};\n");
    }

    TEST_CASE("007: mv rejects bad renames", "[007][commands]") {
        detail::command_fixture fx{};

        SECTION("name clash") {
            commands::mv(*fx.snap, "a b"sv);
            REQUIRE(fx.snap->errors() == 1U);
            CHECK(fx.snap->diagnostics()[0].message == "cannot rename a to b: b already declared");
        }

        SECTION("not an identifier") {
            commands::mv(*fx.snap, "a 9lives"sv);
            REQUIRE(fx.snap->errors() == 1U);
            CHECK(fx.snap->diagnostics()[0].message == "9lives is not an identifier");
        }

        SECTION("different scope") {
            commands::mv(*fx.snap, "box.w other.w2"sv);
            REQUIRE(fx.snap->errors() == 1U);
            CHECK(fx.snap->diagnostics()[0].message == "cannot rename box.w to other.w2: different scope");
        }

        SECTION("missing arguments") {
            commands::mv(*fx.snap, "a"sv);
            REQUIRE(fx.snap->errors() == 1U);
            CHECK(fx.snap->diagnostics()[0].message == "usage: mv item newname | mv item... file");
        }

        CHECK_FALSE(fx.snap->modified());
    }

    TEST_CASE("007: mv moves top-level declarations to a new file", "[007][commands]") {
        detail::command_fixture fx{};

        commands::mv(*fx.snap, "a b moved.cpp"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("a.cpp").empty());
        CHECK(fx.file("moved.cpp") == "int a;\n\nint b;\n");
    }

    TEST_CASE("007: mv appends to an existing file", "[007][commands]") {
        detail::command_fixture fx{};

        commands::mv(*fx.snap, "box a.cpp"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("a.cpp") == "int a;\nint b;\n\nstruct box {\n    int w;\n};\n");
        CHECK(fx.file("box.hpp").empty());
    }

    TEST_CASE("007: mv refuses to move nested items", "[007][commands]") {
        detail::command_fixture fx{};

        commands::mv(*fx.snap, "box.w a.cpp"sv);

        REQUIRE(fx.snap->errors() == 1U);
        CHECK(fx.snap->diagnostics()[0].message == "cannot move box.w: not a top-level declaration (inside box)");
        CHECK_FALSE(fx.snap->modified());
    }

    TEST_CASE("007: ex rewrites token sequences", "[007][commands]") {
        detail::command_fixture fx{};

        commands::ex(*fx.snap, "int -> long"sv);
        commands::ex(*fx.snap, "a + sizeof(\"a\") -> 0"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("a.cpp") == "long a;\nlong b;\n");
        CHECK(fx.file("box.hpp") == "struct box {\n    long w;\n};\n");
        CHECK(fx.file("use.cpp") == "long use() { return 0; }  // a\n");
    }

    TEST_CASE("007: ex accepts several rules", "[007][commands]") {
        detail::command_fixture fx{};

        commands::ex(*fx.snap, "a -> x; b -> y\nbox -> crate"sv);

        REQUIRE(fx.snap->errors() == 0U);
        CHECK(fx.file("a.cpp") == "int x;\nint y;\n");
        CHECK(fx.file("box.hpp") == "struct crate {\n    int w;\n};\n");
    }

    TEST_CASE("007: ex reports malformed and overlapping rules", "[007][commands]") {
        detail::command_fixture fx{};

        SECTION("missing arrow") {
            commands::ex(*fx.snap, "a b"sv);
            REQUIRE(fx.snap->errors() == 1U);
            CHECK(fx.snap->diagnostics()[0].message == "invalid rewrite a b: expected old -> new");
        }

        SECTION("empty pattern") {
            commands::ex(*fx.snap, " -> b"sv);
            REQUIRE(fx.snap->errors() == 1U);
        }

        SECTION("no rules") {
            commands::ex(*fx.snap, ""sv);
            REQUIRE(fx.snap->errors() == 1U);
        }

        SECTION("overlap") {
            commands::ex(*fx.snap, "int a -> int z; a -> q"sv);
            REQUIRE(fx.snap->errors() == 1U);
            CHECK(fx.snap->diagnostics()[0].file == "a.cpp");
            CHECK(fx.snap->diagnostics()[0].line == 1U);
        }
    }

}  // namespace refit::test
