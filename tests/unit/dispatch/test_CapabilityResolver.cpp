#include "dispatch/ArgumentTransformer.hpp"
#include "dispatch/CapabilityResolver.hpp"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

using namespace SF;
using namespace SF::Dispatch;

namespace {

struct Point {
    int x = 0;
    int y = 0;
};

struct Canvas : HandlerHost<Canvas> {
    void plotPoint(Point const&) {}
    void plotPair(int, int) {}
    void plotLabel(std::string const&) {}
    void plotBoth(int, int) {}
    void plotBoth(std::string const&) {}

    static void exposeHandlers(HandlerTable::Builder<Canvas>& builder) {
        builder.handler("plot", &Canvas::plotPoint)
            .handler("plot", &Canvas::plotPair)
            .handler("pair", &Canvas::plotPair)
            .handler("label", &Canvas::plotLabel)
            .handler("both", static_cast<void (Canvas::*)(int, int)>(&Canvas::plotBoth))
            .handler("both", static_cast<void (Canvas::*)(std::string const&)>(&Canvas::plotBoth));
    }
};

auto pointToPair() -> ArgumentTransformer {
    return ArgumentTransformer::Unpack<Point, int, int>("point.xy", [](Point const& p) { return std::tuple<int, int>{p.x, p.y}; });
}

auto pointToLabel() -> ArgumentTransformer {
    return ArgumentTransformer::Unpack<Point, std::string>("point.label", [](Point const& p) {
        return std::tuple<std::string>{std::to_string(p.x) + "," + std::to_string(p.y)};
    });
}

} // namespace

TEST_SUITE("dispatch.argument_transformer") {
    TEST_CASE("Supports requires matching source and a target handler") {
        Canvas canvas;
        auto   xy = pointToPair();

        CHECK(xy.supports(canvas, "pair", SignatureOf<Point>()));
        CHECK_FALSE(xy.supports(canvas, "pair", SignatureOf<int, int>()));
        CHECK_FALSE(xy.supports(canvas, "label", SignatureOf<Point>()));

        std::vector<ArgumentTransformer const*> candidates;
        CHECK(xy.addIfSupportedBy(canvas, "pair", SignatureOf<Point>(), candidates));
        CHECK_FALSE(xy.addIfSupportedBy(canvas, "label", SignatureOf<Point>(), candidates));
        CHECK(candidates.size() == 1);
    }

    TEST_CASE("Transform yields the target shape") {
        auto xy          = pointToPair();
        auto transformed = xy.transform(MakeArguments(Point{3, 4}));
        REQUIRE(transformed.has_value());
        REQUIRE(transformed->size() == 2);
        CHECK(std::any_cast<int>((*transformed)[0]) == 3);
        CHECK(std::any_cast<int>((*transformed)[1]) == 4);
    }

    TEST_CASE("Transform failures are reported as errors") {
        auto xy         = pointToPair();
        auto wrongInput = xy.transform(MakeArguments(1, 2));
        REQUIRE_FALSE(wrongInput.has_value());
        CHECK(wrongInput.error().code == Error::Code::TypeMismatch);

        ArgumentTransformer throwing("throws", SignatureOf<int>(), SignatureOf<float>(), [](ArgumentList const&) -> ArgumentList {
            throw std::runtime_error("cannot");
        });
        auto thrown = throwing.transform(MakeArguments(1));
        REQUIRE_FALSE(thrown.has_value());
        CHECK(thrown.error().code == Error::Code::TransformFailed);

        ArgumentTransformer lying("lies", SignatureOf<int>(), SignatureOf<float>(), [](ArgumentList const&) {
            return MakeArguments(std::string("not a float"));
        });
        auto lied = lying.transform(MakeArguments(1));
        REQUIRE_FALSE(lied.has_value());
        CHECK(lied.error().code == Error::Code::TransformFailed);
    }
}

TEST_SUITE("dispatch.capability_resolver") {
    TEST_CASE("Identity wins over any transformer") {
        Canvas canvas;
        auto   xy = pointToPair();
        std::vector<ArgumentTransformer const*> transformers{&xy};

        auto resolution = CapabilityResolver::resolve("plot", canvas, SignatureOf<Point>(), transformers);
        REQUIRE(resolution.has_value());
        CHECK(resolution->identity());
        CHECK(resolution->handler->parameters == SignatureOf<Point>());

        auto all = CapabilityResolver::candidates("plot", canvas, SignatureOf<Point>(), transformers);
        REQUIRE(all.size() == 2);
        CHECK(all[0].identity());
        CHECK(all[1].transformer == &xy);
    }

    TEST_CASE("First viable transformer in supplied order wins") {
        Canvas canvas;
        auto   xy    = pointToPair();
        auto   label = pointToLabel();

        std::vector<ArgumentTransformer const*> pairFirst{&xy, &label};
        auto first = CapabilityResolver::resolve("both", canvas, SignatureOf<Point>(), pairFirst);
        REQUIRE(first.has_value());
        CHECK(first->transformer == &xy);

        std::vector<ArgumentTransformer const*> labelFirst{&label, &xy};
        auto second = CapabilityResolver::resolve("both", canvas, SignatureOf<Point>(), labelFirst);
        REQUIRE(second.has_value());
        CHECK(second->transformer == &label);
        CHECK(second->handler->parameters == SignatureOf<std::string>());
    }

    TEST_CASE("No viable candidate resolves to nothing") {
        Canvas canvas;
        auto   xy = pointToPair();
        std::vector<ArgumentTransformer const*> transformers{&xy, nullptr};

        CHECK_FALSE(CapabilityResolver::resolve("label", canvas, SignatureOf<Point>(), transformers).has_value());
        CHECK_FALSE(CapabilityResolver::resolve("plot", canvas, SignatureOf<float>(), transformers).has_value());
        CHECK(CapabilityResolver::candidates("missing", canvas, SignatureOf<Point>(), transformers).empty());
    }
}
