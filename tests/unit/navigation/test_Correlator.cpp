#include "navigation/Correlator.hpp"

#include <doctest/doctest.h>

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace SF::Dispatch;
using namespace SF::Navigation;

namespace {

class RecordingStarter : public ActivityStarter {
public:
    auto handleActivityResult(ActivityResult const& result) -> void override {
        this->results.push_back(result);
    }

    std::vector<ActivityResult> results;
};

} // namespace

TEST_SUITE("navigation.correlation_token") {
    TEST_CASE("Tokens are valid and strictly increasing") {
        TokenGenerator   generator;
        CorrelationToken previous;
        CHECK_FALSE(previous.valid());
        for (int i = 0; i < 1000; ++i) {
            auto token = generator.next();
            CHECK(token.valid());
            CHECK(token > previous);
            previous = token;
        }
    }

    TEST_CASE("Concurrent generation never repeats") {
        TokenGenerator                     generator;
        std::vector<std::vector<std::uint64_t>> perThread(4);
        std::vector<std::thread>           threads;
        for (std::size_t t = 0; t < perThread.size(); ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < 500; ++i)
                    perThread[t].push_back(generator.next().value);
            });
        }
        for (auto& thread : threads)
            thread.join();

        std::set<std::uint64_t> unique;
        for (auto const& values : perThread)
            unique.insert(values.begin(), values.end());
        CHECK(unique.size() == 2000);
    }
}

TEST_SUITE("navigation.correlator") {
    TEST_CASE("Arguments stay readable while the caller holds them") {
        Correlator correlator;
        auto       args  = std::make_shared<ArgumentList const>(MakeArguments(std::string("report.pdf"), 3));
        auto       token = correlator.registerArguments(args);

        auto first = correlator.takeArguments(token);
        REQUIRE(first != nullptr);
        CHECK(std::any_cast<std::string>(first->at(0)) == "report.pdf");

        auto second = correlator.takeArguments(token);
        CHECK(second == first);
        CHECK(correlator.argumentCount() == 1);
    }

    TEST_CASE("Arguments vanish once the caller lets go") {
        Correlator       correlator;
        CorrelationToken token;
        {
            auto args = std::make_shared<ArgumentList const>(MakeArguments(1));
            token     = correlator.registerArguments(args);
        }
        CHECK(correlator.argumentCount() == 1);
        CHECK(correlator.reclaim() == 1);
        CHECK(correlator.argumentCount() == 0);
        CHECK(correlator.takeArguments(token) == nullptr);
    }

    TEST_CASE("Reading expired arguments drops the entry") {
        Correlator correlator;
        auto       args  = std::make_shared<ArgumentList const>(MakeArguments(1));
        auto       token = correlator.registerArguments(args);
        args.reset();
        CHECK(correlator.takeArguments(token) == nullptr);
        CHECK(correlator.argumentCount() == 0);
    }

    TEST_CASE("New registrations drop expired arguments") {
        Correlator correlator;
        {
            auto stale = std::make_shared<ArgumentList const>(MakeArguments(1));
            correlator.registerArguments(stale);
            correlator.registerArguments(stale);
        }
        CHECK(correlator.argumentCount() == 2);

        auto live  = std::make_shared<ArgumentList const>(MakeArguments(2));
        auto token = correlator.registerArguments(live);
        CHECK(correlator.argumentCount() == 1);
        CHECK(correlator.takeArguments(token) == live);
    }

    TEST_CASE("Released arguments are no longer readable") {
        Correlator correlator;
        auto       args  = std::make_shared<ArgumentList const>(MakeArguments(1));
        auto       token = correlator.registerArguments(args);
        CHECK(correlator.releaseArguments(token));
        CHECK_FALSE(correlator.releaseArguments(token));
        CHECK(correlator.takeArguments(token) == nullptr);
        CHECK(correlator.argumentCount() == 0);
    }

    TEST_CASE("Results are consumed by the first take") {
        Correlator correlator;
        auto       token = correlator.registerResult(std::string("saved"));
        CHECK(correlator.resultCount() == 1);

        auto value = correlator.takeResult(token);
        REQUIRE(value.has_value());
        CHECK(std::any_cast<std::string>(*value) == "saved");
        CHECK_FALSE(correlator.takeResult(token).has_value());
        CHECK(correlator.resultCount() == 0);
    }

    TEST_CASE("Unknown tokens read as absent") {
        Correlator       correlator;
        CorrelationToken unknown{12345};
        CHECK(correlator.takeArguments(unknown) == nullptr);
        CHECK_FALSE(correlator.takeResult(unknown).has_value());
        CHECK_FALSE(correlator.takeAndDispatch(unknown, ActivityResult{}));
        CHECK_FALSE(correlator.releasePendingHandler(unknown));
    }

    TEST_CASE("Pending handlers are dispatched exactly once") {
        Correlator correlator;
        auto       starter = std::make_shared<RecordingStarter>();
        auto       token   = correlator.registerPendingHandler(starter);
        CHECK(correlator.pendingHandlerCount() == 1);

        ActivityResult result{7, ResultCode::Ok, nlohmann::json{{"picked", "photo.png"}}};
        CHECK(correlator.takeAndDispatch(token, result));
        CHECK_FALSE(correlator.takeAndDispatch(token, result));
        REQUIRE(starter->results.size() == 1);
        CHECK(starter->results.front().requestCode == 7);
        CHECK(starter->results.front().data->at("picked") == "photo.png");
        CHECK(correlator.pendingHandlerCount() == 0);
    }

    TEST_CASE("Released handlers are never dispatched") {
        Correlator correlator;
        auto       starter = std::make_shared<RecordingStarter>();
        auto       token   = correlator.registerPendingHandler(starter);
        CHECK(correlator.releasePendingHandler(token));
        CHECK_FALSE(correlator.takeAndDispatch(token, ActivityResult{}));
        CHECK(starter->results.empty());
    }

    TEST_CASE("Tables are independent and clear empties all of them") {
        Correlator correlator;
        auto       args = std::make_shared<ArgumentList const>(MakeArguments(1));
        auto       a    = correlator.registerArguments(args);
        auto       r    = correlator.registerResult(2);
        auto       h    = correlator.registerPendingHandler(std::make_shared<RecordingStarter>());
        CHECK(a != r);
        CHECK(r != h);
        CHECK_FALSE(correlator.takeResult(a).has_value());
        CHECK(correlator.takeArguments(r) == nullptr);

        correlator.clear();
        CHECK(correlator.argumentCount() == 0);
        CHECK(correlator.resultCount() == 0);
        CHECK(correlator.pendingHandlerCount() == 0);
    }
}
