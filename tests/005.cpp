#include "utils.hpp"

namespace refit::test {
    using namespace std::string_view_literals;

    namespace detail {
        inline void make_tree(const fs::path& root) {
            write_text_file(root / "a.cpp", "int a;\nint b;\n");
            write_text_file(root / "include/b.hpp", "struct box {\n    int w;\n};\n");
            write_text_file(root / "notes.txt", "not source\n");
            write_text_file(root / "build/gen.cpp", "int generated;\n");
            write_text_file(root / ".git/hook.c", "int hook;\n");
        }
    }  // namespace detail

    TEST_CASE("005: edit_buffer composes edits against the base", "[005][snapshot]") {
        edit_buffer buf{"hello world"};
        buf.replace(0U, 5U, "HELLO");
        buf.insert(11U, "!");
        buf.insert(5U, ",");

        CHECK(buf.bytes() == "HELLO, world!");
        CHECK(buf.base() == "hello world");
        CHECK(buf.changed());
    }

    TEST_CASE("005: edit_buffer rejects overlapping edits", "[005][snapshot]") {
        edit_buffer buf{"0123456789"};
        buf.replace(2U, 6U, "x");

        CHECK_THROWS_AS(buf.replace(4U, 8U, "y"), edit_conflict);
        CHECK_THROWS_AS(buf.insert(3U, "y"), edit_conflict);
        CHECK_THROWS_AS(buf.replace(2U, 6U, "z"), edit_conflict);
        CHECK_THROWS_AS(buf.replace(5U, 20U, "z"), std::out_of_range);

        // edges of a replaced range and repeated identical edits are fine
        CHECK_NOTHROW(buf.insert(2U, "<"));
        CHECK_NOTHROW(buf.insert(6U, ">"));
        CHECK_NOTHROW(buf.replace(2U, 6U, "x"));
        CHECK(buf.bytes() == "01<x>6789");
    }

    TEST_CASE("005: edit_buffer assign and no-op edits", "[005][snapshot]") {
        edit_buffer buf{"abc"};
        buf.insert(1U, "");
        CHECK_FALSE(buf.empty());
        CHECK_FALSE(buf.changed());

        buf.assign("xyz");
        CHECK(buf.bytes() == "xyz");
    }

    TEST_CASE("005: diagnostics render like compiler errors", "[005][snapshot]") {
        CHECK(diagnostic{.file = "a.cpp", .line = 3U, .column = 7U, .message = "boom"}.to_string() ==
              "a.cpp:3:7: error: boom");
        CHECK(diagnostic{.file = "a.cpp", .line = 3U, .message = "boom"}.to_string() == "a.cpp:3: error: boom");
        CHECK(diagnostic{.file = "a.cpp", .message = "boom"}.to_string() == "a.cpp: error: boom");
        CHECK(diagnostic{.message = "boom"}.to_string() == "error: boom");
    }

    TEST_CASE("005: workspace loads source files below the root", "[005][workspace]") {
        detail::temp_dir temp{"refit_005_scan"};
        detail::make_tree(temp.path);
        detail::test_session ts{temp.path};

        workspace ws{ts.s};
        auto snap = ws.load();

        REQUIRE(snap);
        CHECK(snap->errors() == 0U);
        CHECK(snap->files().size() == 2U);
        CHECK(snap->has_file("a.cpp"));
        CHECK(snap->has_file("include/b.hpp"));
        CHECK_FALSE(snap->has_file("notes.txt"));
        CHECK_FALSE(snap->has_file("build/gen.cpp"));
        CHECK_FALSE(snap->has_file(".git/hook.c"));

        CHECK(snap->target().name == temp.path.filename().string());
        CHECK(snap->target().files == std::vector<std::string>{"a.cpp", "include/b.hpp"});
        CHECK(snap->items().find("box.w"));
        CHECK(ws.original() == snap->files());
        CHECK(&snap->session() == &ts.s);
    }

    TEST_CASE("005: workspace load failures", "[005][workspace]") {
        detail::temp_dir temp{"refit_005_load_fail"};

        SECTION("missing root") {
            detail::test_session ts{temp.path / "missing"};
            workspace ws{ts.s};
            CHECK_THROWS_AS(ws.load(), load_error);
        }

        SECTION("no source files") {
            detail::write_text_file(temp.path / "README", "hi\n");
            detail::test_session ts{temp.path};
            workspace ws{ts.s};
            CHECK_THROWS_AS(ws.load(), load_error);
        }
    }

    TEST_CASE("005: built-in checks report unbalanced code", "[005][workspace]") {
        detail::temp_dir temp{"refit_005_balance"};
        detail::write_text_file(temp.path / "ok.cpp", "int f() { return (1); }\n");
        detail::write_text_file(temp.path / "bad.cpp", "int g() {\n    return 1;\n");
        detail::test_session ts{temp.path};

        workspace ws{ts.s};
        auto snap = ws.load();

        REQUIRE(snap->errors() == 1U);
        CHECK(snap->diagnostics()[0].to_string() == "bad.cpp:1:9: error: unclosed '{'");
    }

    TEST_CASE("005: the load debug key reports each load", "[005][workspace]") {
        detail::temp_dir temp{"refit_005_debug"};
        detail::make_tree(temp.path);
        detail::test_session ts{temp.path};
        ts.s.debug["load"] = "1";

        workspace ws{ts.s};
        auto snap = ws.load();

        CHECK(ts.err.str() == "load: 2 files, 0 errors\n");
    }

    TEST_CASE("005: pending edits become visible on reload", "[005][snapshot]") {
        detail::temp_dir temp{"refit_005_reload"};
        detail::make_tree(temp.path);
        detail::test_session ts{temp.path};

        workspace ws{ts.s};
        auto snap = ws.load();
        snap->replace("a.cpp", 4U, 5U, "z");
        snap->append("a.cpp", "int c;\n");

        // the snapshot keeps describing the state it was loaded from
        CHECK(*snap->text("a.cpp") == "int a;\nint b;\n");
        CHECK(snap->items().find("a"));
        CHECK(snap->modified());
        CHECK(snap->current_files().at("a.cpp") == "int z;\nint b;\nint c;\n");

        auto next = snap->load();
        CHECK(*next->text("a.cpp") == "int z;\nint b;\nint c;\n");
        CHECK(next->items().find("z"));
        CHECK(next->items().find("c"));
        CHECK_FALSE(next->items().find("a"));
        CHECK_FALSE(next->modified());
        // the original state is kept from the first load
        CHECK(ws.original().at("a.cpp") == "int a;\nint b;\n");
    }

    TEST_CASE("005: creating and removing files", "[005][snapshot]") {
        detail::temp_dir temp{"refit_005_files"};
        detail::make_tree(temp.path);
        detail::test_session ts{temp.path};

        workspace ws{ts.s};
        auto snap = ws.load();

        snap->create_file("src/new.cpp", "int n;\n");
        CHECK(snap->has_file("src/new.cpp"));
        CHECK_FALSE(snap->text("src/new.cpp"));
        snap->append("src/new.cpp", "int m;\n");
        CHECK_THROWS_AS(snap->create_file("a.cpp", ""), std::invalid_argument);

        snap->remove_file("include/b.hpp");
        CHECK_FALSE(snap->has_file("include/b.hpp"));
        CHECK_THROWS_AS(snap->remove_file("include/b.hpp"), std::invalid_argument);
        CHECK_THROWS_AS(snap->replace("include/b.hpp", 0U, 1U, "x"), std::invalid_argument);
        CHECK_THROWS_AS(snap->append("nope.cpp", "x"), std::invalid_argument);

        auto files = snap->current_files();
        CHECK(files.size() == 2U);
        CHECK(files.at("src/new.cpp") == "int n;\nint m;\n");
        CHECK_FALSE(files.contains("include/b.hpp"));
    }

    TEST_CASE("005: file paths stay below the workspace root", "[005][snapshot]") {
        CHECK(workspace_relative("src/a.cpp"sv) == "src/a.cpp");
        CHECK(workspace_relative("./src/../b.cpp"sv) == "b.cpp");
        CHECK_THROWS_AS(workspace_relative("/tmp/x.cpp"sv), std::invalid_argument);
        CHECK_THROWS_AS(workspace_relative("../x.cpp"sv), std::invalid_argument);
        CHECK_THROWS_AS(workspace_relative("src/../../x.cpp"sv), std::invalid_argument);
        CHECK_THROWS_AS(workspace_relative("."sv), std::invalid_argument);
        CHECK_THROWS_AS(workspace_relative(""sv), std::invalid_argument);

        detail::temp_dir temp{"refit_005_paths"};
        detail::make_tree(temp.path);
        detail::test_session ts{temp.path};

        workspace ws{ts.s};
        auto snap = ws.load();

        auto outside = (temp.path / "x.cpp").string();
        CHECK_THROWS_AS(snap->create_file(outside, "int x;\n"), std::invalid_argument);
        CHECK_THROWS_AS(snap->create_file("../x.cpp", "int x;\n"), std::invalid_argument);
        CHECK_THROWS_AS(snap->append("../x.cpp", "int x;\n"), std::invalid_argument);
        CHECK_FALSE(snap->modified());

        snap->create_file("./src/new.cpp", "int n;\n");
        CHECK(snap->has_file("src/new.cpp"));
        CHECK(snap->current_files().contains("src/new.cpp"));
    }

    TEST_CASE("005: errors attach to a snapshot synchronously", "[005][snapshot]") {
        detail::temp_dir temp{"refit_005_errors"};
        detail::make_tree(temp.path);
        detail::test_session ts{temp.path};

        workspace ws{ts.s};
        auto snap = ws.load();
        snap->add_error("plain");
        snap->error_at("a.cpp", 11U, "located");

        REQUIRE(snap->errors() == 2U);
        CHECK(snap->diagnostics()[0].to_string() == "error: plain");
        CHECK(snap->diagnostics()[1].to_string() == "a.cpp:2:5: error: located");
    }

    TEST_CASE("005: normalize tidies touched files only", "[005][snapshot]") {
        detail::temp_dir temp{"refit_005_normalize"};
        detail::write_text_file(temp.path / "a.cpp", "int a;\n");
        detail::write_text_file(temp.path / "messy.cpp", "int m;   \n\n\n\nint n;");
        detail::test_session ts{temp.path};

        workspace ws{ts.s};
        auto snap = ws.load();
        snap->append("a.cpp", "\n\n\nint b;   \t\n\n");
        snap->normalize();

        auto files = snap->current_files();
        CHECK(files.at("a.cpp") == "int a;\n\nint b;\n");
        CHECK(files.at("messy.cpp") == "int m;   \n\n\n\nint n;");
    }

    TEST_CASE("005: write persists changed files only", "[005][snapshot]") {
        detail::temp_dir temp{"refit_005_write"};
        detail::make_tree(temp.path);
        detail::test_session ts{temp.path};

        workspace ws{ts.s};
        auto snap = ws.load();
        snap->replace("a.cpp", 4U, 5U, "q");
        snap->create_file("sub/dir/new.hpp", "int fresh;\n");
        snap->remove_file("include/b.hpp");

        CHECK(snap->write() == 3U);
        CHECK(detail::read_text_file(temp.path / "a.cpp") == "int q;\nint b;\n");
        CHECK(detail::read_text_file(temp.path / "sub/dir/new.hpp") == "int fresh;\n");
        CHECK_FALSE(std::filesystem::exists(temp.path / "include/b.hpp"));
        // untouched and ignored files stay as they were
        CHECK(detail::read_text_file(temp.path / "notes.txt") == "not source\n");
    }

    TEST_CASE("005: custom checkers replace the built-in ones", "[005][workspace]") {
        struct marker_checker final : checker {
            std::vector<diagnostic> check(const file_map& files) const override {
                std::vector<diagnostic> out{};
                for (const auto& [path, text] : files) {
                    if (text.find("BROKEN") != std::string::npos) {
                        out.push_back(diagnostic{.file = path, .line = 1U, .column = 1U, .message = "marked"});
                    }
                }
                return out;
            }
        };

        detail::temp_dir temp{"refit_005_custom"};
        detail::write_text_file(temp.path / "a.cpp", "int a; BROKEN {\n");
        detail::test_session ts{temp.path};

        std::vector<std::unique_ptr<checker>> checkers{};
        checkers.push_back(std::make_unique<marker_checker>());
        workspace ws{ts.s, std::move(checkers)};
        auto snap = ws.load();

        // the unbalanced brace goes unnoticed without the balance checker
        REQUIRE(snap->errors() == 1U);
        CHECK(snap->diagnostics()[0].message == "marked");
    }

}  // namespace refit::test
