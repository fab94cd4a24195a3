#include <catch2/catch_test_macros.hpp>
#include "../src/notifier.hpp"
#include "test_support.hpp"
#include <nlohmann/json.hpp>

namespace {

Notifier make_notifier(test::FakeTransport& transport, size_t limit) {
    return Notifier(transport, "-100123", limit, std::chrono::milliseconds(0), test::null_logger());
}

} // namespace

TEST_CASE("Message splitting keeps blocks whole", "[notifier]") {
    const std::string a(10, 'a');
    const std::string b(10, 'b');
    const std::string c(10, 'c');

    auto chunks = Notifier::split_message("H", {a, b, c}, 25);

    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[0] == "H\n\n" + a + "\n\n" + b);
    REQUIRE(chunks[1] == c);

    for (const auto& chunk : chunks) {
        REQUIRE(chunk.size() <= 25);
    }
}

TEST_CASE("Message splitting of oversized content", "[notifier]") {
    SECTION("Oversized block splits on lines") {
        std::string block;
        for (int i = 0; i < 10; i++) {
            if (i > 0) block += "\n";
            block += "line " + std::to_string(i) + " xxxxxxxx";
        }

        auto chunks = Notifier::split_message("Header", {block}, 40);
        REQUIRE(chunks.size() > 1);
        REQUIRE(chunks[0].rfind("Header\n\n", 0) == 0);

        for (const auto& chunk : chunks) {
            REQUIRE(chunk.size() <= 40);
            // lines are never cut
            for (const auto& line : util::split(chunk, '\n')) {
                REQUIRE((line.empty() || line == "Header" || line.rfind("line ", 0) == 0));
            }
        }
    }

    SECTION("Single long line is hard-split") {
        const std::string line(100, 'x');
        auto chunks = Notifier::split_message("", {line}, 30);

        REQUIRE(chunks.size() == 4);
        std::string rejoined;
        for (const auto& chunk : chunks) {
            REQUIRE(chunk.size() <= 30);
            rejoined += chunk;
        }
        REQUIRE(rejoined == line);
    }

    SECTION("Hard split respects UTF-8 characters") {
        std::string line;
        for (int i = 0; i < 20; i++) line += "й";  // 2 bytes each

        auto chunks = Notifier::split_message("", {line}, 7);
        std::string rejoined;
        for (const auto& chunk : chunks) {
            REQUIRE(chunk.size() <= 7);
            REQUIRE(chunk.size() % 2 == 0);
            rejoined += chunk;
        }
        REQUIRE(rejoined == line);
    }

    SECTION("Limit narrower than one character keeps characters whole") {
        const std::string line = "aйбc";

        auto chunks = Notifier::split_message("", {line}, 1);
        REQUIRE(chunks == std::vector<std::string>{"a", "й", "б", "c"});

        for (const auto& chunk : chunks) {
            REQUIRE_NOTHROW(nlohmann::json(chunk).dump());
        }
    }
}

TEST_CASE("Notifier delivery", "[notifier]") {
    test::FakeTransport transport;

    SECTION("Short text is one message") {
        auto notifier = make_notifier(transport, 4096);
        REQUIRE(notifier.send("hello\n\nworld") == 1);

        auto sent = transport.sent();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].text == "hello\n\nworld");
        REQUIRE(sent[0].chat_id == "-100123");
        REQUIRE_FALSE(sent[0].silent);
    }

    SECTION("Paragraphs are spread over chunks") {
        auto notifier = make_notifier(transport, 12);
        REQUIRE(notifier.send("aaaa\n\nbbbb\n\ncccc") == 2);

        auto sent = transport.sent();
        REQUIRE(sent[0].text == "aaaa\n\nbbbb");
        REQUIRE(sent[1].text == "cccc");
    }

    SECTION("A failed chunk does not stop later ones") {
        transport.fail_calls({false, true, false});
        auto notifier = make_notifier(transport, 12);

        REQUIRE(notifier.send("", {"aaaaaaaaaa", "bbbbbbbbbb", "cccccccccc"}) == 2);
        REQUIRE(transport.calls() == 3);

        auto sent = transport.sent();
        REQUIRE(sent.size() == 2);
        REQUIRE(sent[1].text == "cccccccccc");
    }

    SECTION("Silent batches") {
        auto notifier = make_notifier(transport, 4096);
        REQUIRE(notifier.send("Reminders", {"one"}, true) == 1);
        REQUIRE(transport.sent()[0].silent);
    }

    SECTION("Nothing to send") {
        auto notifier = make_notifier(transport, 4096);
        REQUIRE(notifier.send("Header", std::vector<std::string>{}) == 0);
        REQUIRE(transport.calls() == 0);
    }
}

TEST_CASE("Notifier survives a throwing transport", "[notifier]") {
    class ThrowingTransport : public MessageTransport {
    public:
        int calls = 0;
        bool send_message(const std::string&, const std::string&, bool) override {
            if (calls++ == 0) throw std::runtime_error("socket closed");
            return true;
        }
    };

    ThrowingTransport transport;
    Notifier notifier(transport, "1", 5, std::chrono::milliseconds(0), test::null_logger());

    REQUIRE(notifier.send("", {"aaaa", "bbbb"}) == 1);
    REQUIRE(transport.calls == 2);
}
