#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "docqa/infra/dotenv.hpp"

namespace fs = std::filesystem;

static auto write_env_file(const std::string& content) -> fs::path {
    auto tmp = fs::temp_directory_path() / "docqa_test_dotenv_file.env";
    std::ofstream out(tmp);
    out << content;
    out.close();
    return tmp;
}

TEST_CASE("dotenv parse basic KEY=VALUE", "[infra][dotenv]") {
    auto path = write_env_file("QDRANT_URL=http://localhost:6333\nQDRANT_COLLECTION=capillary_docs\n");
    auto env = docqa::infra::parse_env_file(path);

    REQUIRE(env.size() == 2);
    CHECK(env["QDRANT_URL"] == "http://localhost:6333");
    CHECK(env["QDRANT_COLLECTION"] == "capillary_docs");

    fs::remove(path);
}

TEST_CASE("dotenv parse quoted values", "[infra][dotenv]") {
    auto path = write_env_file(R"(MSG="hello world")" "\n"
                               R"(ESCAPED="line1\nline2")" "\n"
                               "LITERAL='hello\\nworld'\n");
    auto env = docqa::infra::parse_env_file(path);

    CHECK(env["MSG"] == "hello world");
    CHECK(env["ESCAPED"] == "line1\nline2");
    // Single-quoted values are literal.
    CHECK(env["LITERAL"] == "hello\\nworld");

    fs::remove(path);
}

TEST_CASE("dotenv parse skips comments, blank and malformed lines", "[infra][dotenv]") {
    auto path = write_env_file(
        "# This is a comment\n"
        "\n"
        "KEY1=value1\n"
        "no_equals_sign\n"
        "PORT=8080 # server port\n"
        "export KEY2=value2\n"
    );
    auto env = docqa::infra::parse_env_file(path);

    REQUIRE(env.size() == 3);
    CHECK(env["KEY1"] == "value1");
    CHECK(env["PORT"] == "8080");
    CHECK(env["KEY2"] == "value2");

    fs::remove(path);
}

TEST_CASE("dotenv expands references to earlier keys", "[infra][dotenv]") {
    auto path = write_env_file(
        "HOST=qdrant.internal\n"
        "QDRANT_URL=http://${HOST}:6333\n"
        "QUOTED=\"${HOST}/x\"\n"
        "RAW='${HOST}'\n"
    );
    auto env = docqa::infra::parse_env_file(path);

    CHECK(env["QDRANT_URL"] == "http://qdrant.internal:6333");
    CHECK(env["QUOTED"] == "qdrant.internal/x");
    CHECK(env["RAW"] == "${HOST}");

    fs::remove(path);
}

TEST_CASE("dotenv parse returns empty for missing file", "[infra][dotenv]") {
    auto env = docqa::infra::parse_env_file("/nonexistent/path/.env");
    CHECK(env.empty());
    CHECK(docqa::infra::load_env_file("/nonexistent/path/.env") == 0);
}

TEST_CASE("load_env_file keeps existing variables unless overwriting", "[infra][dotenv]") {
    setenv("DOCQA_DOTENV_EXISTING", "original", 1);
    unsetenv("DOCQA_DOTENV_FRESH");

    auto path = write_env_file(
        "DOCQA_DOTENV_EXISTING=from_file\n"
        "DOCQA_DOTENV_FRESH=fresh\n"
    );

    CHECK(docqa::infra::load_env_file(path) == 1);
    CHECK(std::string(std::getenv("DOCQA_DOTENV_EXISTING")) == "original");
    CHECK(std::string(std::getenv("DOCQA_DOTENV_FRESH")) == "fresh");

    CHECK(docqa::infra::load_env_file(path, true) == 2);
    CHECK(std::string(std::getenv("DOCQA_DOTENV_EXISTING")) == "from_file");

    unsetenv("DOCQA_DOTENV_EXISTING");
    unsetenv("DOCQA_DOTENV_FRESH");
    fs::remove(path);
}
