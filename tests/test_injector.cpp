#include <catch2/catch.hpp>

#include "ExclusionPolicy.h"
#include "Fakes.h"
#include "TextInjector.h"

using namespace std;
using namespace qvt_test;

namespace {

TextInjector makeInjector(shared_ptr<FakeInputBackend> backend,
                          QStringList excluded = ExclusionPolicy::defaultEntries())
{
    return TextInjector{std::move(backend),
                        make_shared<const ExclusionPolicy>(excluded),
                        TextInjector::Pacing{0ms, 0ms}};
}

} // anon ns

TEST_CASE("Text is prepared before typing", "[injector]")
{
    CHECK(TextInjector::prepareText("  hello there world  ") == "hello there world.");
    CHECK(TextInjector::prepareText("hello world") == "hello world");
    CHECK(TextInjector::prepareText("Is this it?") == "Is this it?");
    CHECK(TextInjector::prepareText("Stop it now!") == "Stop it now!");
    CHECK(TextInjector::prepareText("   ").isEmpty());
}

TEST_CASE("Select the text to type for each mode", "[injector]")
{
    const optional<QString> corrected{"Hello, world."};

    CHECK(TextInjector::selectTexts("hello world", corrected, InjectionMode::Raw) == QStringList{"hello world"});
    CHECK(TextInjector::selectTexts("hello world", corrected, InjectionMode::Corrected) == QStringList{"Hello, world."});
    CHECK(TextInjector::selectTexts("hello world", nullopt, InjectionMode::Corrected) == QStringList{"hello world"});
    CHECK(TextInjector::selectTexts("hello world", corrected, InjectionMode::Both)
          == QStringList{"hello world", "Hello, world."});
    CHECK(TextInjector::selectTexts("hello world", nullopt, InjectionMode::Both) == QStringList{"hello world"});
}

TEST_CASE("Excluded applications get no keystrokes", "[injector]")
{
    for (const auto& app : {"Keychain Access", "keychain access", "1Password 8", "Login Window"}) {
        auto backend = make_shared<FakeInputBackend>(QString::fromUtf8(app));
        auto injector = makeInjector(backend);

        const auto result = injector.inject("my secret password", nullopt, InjectionMode::Raw);
        CHECK(result.ok());
        CHECK(result.status == InjectionResult::Status::Skipped);
        CHECK(result.keystrokes == 0);
        CHECK(backend->keys().isEmpty());
    }
}

TEST_CASE("The exclusion policy matches case insensitive substrings", "[injector]")
{
    ExclusionPolicy policy{{" Keychain Access ", "keychain access", "", "Terminal"}};
    CHECK(policy.entries().size() == 2);
    CHECK(policy.match("org.gnome.Terminal") == QString{"Terminal"});
    CHECK_FALSE(policy.excludes("gedit"));
    CHECK_FALSE(policy.excludes(""));
}

TEST_CASE("Newlines and tabs are sent as keys", "[injector]")
{
    auto backend = make_shared<FakeInputBackend>();
    auto injector = makeInjector(backend);

    const auto result = injector.inject("one\ttwo\r\nthree 👍");
    CHECK(result.status == InjectionResult::Status::Typed);
    CHECK(result.app == "gedit");

    const auto keys = backend->keys();
    CHECK(keys.contains("<Tab>"));
    CHECK(keys.contains("<Return>"));
    CHECK_FALSE(keys.contains("\r"));
    // The emoji is one keystroke, not two surrogates
    CHECK(keys.back() == QString::fromUtf8("👍"));
    CHECK(result.keystrokes == keys.size());
}

TEST_CASE("Both mode types raw and corrected text", "[injector]")
{
    auto backend = make_shared<FakeInputBackend>();
    auto injector = makeInjector(backend);

    const auto result = injector.inject("hi there", QString{"Hi there."}, InjectionMode::Both);
    CHECK(result.status == InjectionResult::Status::Typed);
    CHECK(backend->typed() == "hi there Hi there.");
    CHECK(result.keystrokes == 18);
}

TEST_CASE("Nothing to type is not an error", "[injector]")
{
    auto backend = make_shared<FakeInputBackend>();
    backend->deny_access = true;
    auto injector = makeInjector(backend);

    const auto result = injector.inject("  ");
    CHECK(result.status == InjectionResult::Status::Typed);
    CHECK(result.keystrokes == 0);
}

TEST_CASE("Backend errors are reported as failures", "[injector]")
{
    auto backend = make_shared<FakeInputBackend>();
    auto injector = makeInjector(backend);

    SECTION("no access") {
        backend->deny_access = true;
        const auto result = injector.inject("hello");
        CHECK(result.status == InjectionResult::Status::Failed);
        CHECK_FALSE(result.ok());
        CHECK(backend->keys().isEmpty());
    }

    SECTION("failure while typing") {
        backend->fail_after = 2;
        const auto result = injector.inject("hello");
        CHECK(result.status == InjectionResult::Status::Failed);
        CHECK(result.keystrokes == 2);
        CHECK(result.error.contains("xdotool"));
    }
}

TEST_CASE("The exclusion policy can be replaced", "[injector]")
{
    auto backend = make_shared<FakeInputBackend>("Signal");
    auto injector = makeInjector(backend);

    CHECK(injector.inject("hi").status == InjectionResult::Status::Typed);

    injector.setExclusionPolicy(make_shared<const ExclusionPolicy>(QStringList{"signal"}));
    CHECK(injector.inject("hi").status == InjectionResult::Status::Skipped);

    injector.setExclusionPolicy({});
    CHECK(injector.exclusionPolicy()->entries().isEmpty());
}
