#include "dispatch/HandlerTable.hpp"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>

using namespace SF::Dispatch;

namespace {

struct Editor : HandlerHost<Editor> {
    int         saves = 0;
    std::string title;

    void save() {
        ++this->saves;
    }
    void rename(std::string const& name) {
        this->title = name;
    }
    void resize(int width, int height) {
        this->title = std::to_string(width) + "x" + std::to_string(height);
    }
    void resize(double scale) {
        this->title = "scaled " + std::to_string(static_cast<int>(scale * 10));
    }
    [[nodiscard]] int saveCount() const {
        return this->saves;
    }

    static void exposeHandlers(HandlerTable::Builder<Editor>& builder) {
        builder.handler("save", &Editor::save)
            .handler("rename", &Editor::rename)
            .handler("resize", static_cast<void (Editor::*)(int, int)>(&Editor::resize))
            .handler("resize", static_cast<void (Editor::*)(double)>(&Editor::resize))
            .handler("saveCount", &Editor::saveCount);
    }
};

} // namespace

TEST_SUITE("dispatch.handler_table") {
    TEST_CASE("Lookup is by name and exact parameter types") {
        Editor      editor;
        auto const& table = editor.handlerTable();

        CHECK(table.size() == 5);
        CHECK(table.contains("save", {}));
        CHECK(table.contains("rename", SignatureOf<std::string>()));
        CHECK_FALSE(table.contains("rename", SignatureOf<char const*>()));
        CHECK(table.contains("resize", SignatureOf<int, int>()));
        CHECK_FALSE(table.contains("resize", SignatureOf<float>()));
        CHECK_FALSE(table.contains("missing", {}));
        CHECK(table.find("resize", SignatureOf<long, long>()) == nullptr);
    }

    TEST_CASE("Overloads keep registration order") {
        auto overloads = Editor::table().overloads("resize");
        REQUIRE(overloads.size() == 2);
        CHECK(overloads[0]->parameters == SignatureOf<int, int>());
        CHECK(overloads[1]->parameters == SignatureOf<double>());
        CHECK(Editor::table().overloads("nothing").empty());
    }

    TEST_CASE("Table is built once per receiver type") {
        Editor first;
        Editor second;
        CHECK(&first.handlerTable() == &second.handlerTable());
        CHECK(&first.handlerTable() == &Editor::table());
    }

    TEST_CASE("Entries invoke the bound member function") {
        Editor editor;
        auto const* save = editor.handlerTable().find("save", {});
        REQUIRE(save != nullptr);
        ArgumentList none;
        auto         returned = save->invoke(editor, none);
        CHECK_FALSE(returned.has_value());
        CHECK(editor.saves == 1);

        auto const* count = editor.handlerTable().find("saveCount", {});
        REQUIRE(count != nullptr);
        CHECK(count->returnType == std::type_index(typeid(int)));
        auto value = count->invoke(editor, none);
        CHECK(std::any_cast<int>(value) == 1);

        auto const* resize = editor.handlerTable().find("resize", SignatureOf<int, int>());
        REQUIRE(resize != nullptr);
        auto args = MakeArguments(640, 480);
        resize->invoke(editor, args);
        CHECK(editor.title == "640x480");
    }

    TEST_CASE("Argument count mismatch is rejected by the invoker") {
        Editor      editor;
        auto const* rename = editor.handlerTable().find("rename", SignatureOf<std::string>());
        REQUIRE(rename != nullptr);
        ArgumentList none;
        CHECK_THROWS_AS(rename->invoke(editor, none), std::invalid_argument);
    }

    TEST_CASE("Duplicate keys are rejected") {
        HandlerTable table;
        HandlerEntry entry{"tap", SignatureOf<int>(), std::type_index(typeid(void)),
                           [](Receiver&, ArgumentList&) -> std::any { return {}; }};
        CHECK(table.add(entry));
        CHECK_FALSE(table.add(entry));
        CHECK(table.size() == 1);

        HandlerEntry other = entry;
        other.parameters   = SignatureOf<float>();
        CHECK(table.add(other));
        CHECK(table.overloads("tap").size() == 2);

        HandlerEntry unnamed{"", {}, std::type_index(typeid(void)), entry.invoke};
        CHECK_FALSE(table.add(unnamed));
    }

    TEST_CASE("Signatures strip references and qualifiers") {
        CHECK(SignatureOf<std::string const&>() == SignatureOf<std::string>());
        CHECK(SignatureOf<int&&>() == SignatureOf<int>());
        CHECK(signatureOf(MakeArguments(1, 2.0f, std::string("x"))) == SignatureOf<int, float, std::string>());
        CHECK(describeSignature({}) == "()");
    }
}
