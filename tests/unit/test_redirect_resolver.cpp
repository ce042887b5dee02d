#include <cassert>
#include <string>
#include <vector>
#include <utility>
#include "../../src/middleware/redirect_resolver.h"

using namespace cleanpath;

static CleanPathOptions default_options() {
    CleanPathOptions options;
    options.exempt_paths = {"/health", "/metrics"};
    return options;
}

static void test_clean() {
    RedirectResolver resolver(default_options());
    std::vector<std::pair<std::string, std::string>> cases = {
        {"//", "/"},
        {"///", "/"},
        {"///?a=1", "/?a=1"},
        {"///?a=1&b=2", "/?a=1&b=2"},
        {"//?a=1", "/?a=1"},
        {"//a//b//", "/a/b/"},
        {"//a//b//.", "/a/b/"},
        {"//a//b//./", "/a/b/"},
        {"//m.js", "/m.js"},
        {"/a//b", "/a/b/"},
        {"/a//b/", "/a/b/"},
        {"/a//b//", "/a/b/"},
        {"/a//m.js", "/a/m.js"},
        {"/m.", "/m./"},
    };

    for (const auto& [given, clean] : cases) {
        RedirectDecision decision = resolver.resolve(given, "localhost");
        assert(decision.redirect);
        assert(decision.status == 308);
        assert(decision.location == "http://localhost" + clean);
    }
}

static void test_pristine() {
    RedirectResolver resolver(default_options());
    std::vector<std::string> cases = {"/", "/a/", "/a/b/", "/m.js", "/m./", "/a/?q=//x/.."};
    for (const auto& given : cases) {
        RedirectDecision decision = resolver.resolve(given, "localhost");
        assert(!decision.redirect);
        assert(decision.location.empty());
    }
}

static void test_fragment_and_canonical_path() {
    RedirectResolver resolver(default_options());
    RedirectDecision decision = resolver.resolve("/docs//intro?lang=en#setup", "example.com:8443");
    assert(decision.redirect);
    assert(decision.canonical_path == "/docs/intro/");
    assert(decision.location == "http://example.com:8443/docs/intro/?lang=en#setup");
}

static void test_options() {
    CleanPathOptions options = default_options();
    options.redirect_status = 301;
    options.scheme = "https";
    RedirectResolver moved(options);
    RedirectDecision decision = moved.resolve("/a//b", "example.com");
    assert(decision.status == 301);
    assert(decision.location == "https://example.com/a/b/");

    // Relative Location when there is no Host or absolute form is off
    RedirectResolver resolver(default_options());
    assert(resolver.resolve("//a?x", "").location == "/a/?x");

    options.absolute_location = false;
    RedirectResolver relative(options);
    assert(relative.resolve("//a?x", "example.com").location == "/a/?x");

    // Absolute-form targets keep their own scheme and authority
    decision = resolver.resolve("https://proxy.example//x//y.css", "ignored");
    assert(decision.redirect);
    assert(decision.location == "https://proxy.example/x/y.css");
}

static void test_pass_through() {
    RedirectResolver resolver(default_options());
    // exempt routes
    assert(!resolver.resolve("/health", "localhost").redirect);
    assert(!resolver.resolve("/metrics?x=1", "localhost").redirect);
    // asterisk-form and garbage
    assert(!resolver.resolve("*", "localhost").redirect);
    assert(!resolver.resolve("", "localhost").redirect);
    assert(!resolver.resolve("http://example.com", "localhost").redirect);
}

static void test_exempt_slash_forms() {
    RedirectResolver resolver(default_options());

    // Slash-suffixed and uncollapsed forms of an exempt route lead back to it
    RedirectDecision decision = resolver.resolve("/health/", "localhost");
    assert(decision.redirect);
    assert(decision.location == "http://localhost/health");

    decision = resolver.resolve("//health", "localhost");
    assert(decision.redirect);
    assert(decision.canonical_path == "/health");

    decision = resolver.resolve("/metrics//?format=json", "localhost");
    assert(decision.redirect);
    assert(decision.location == "http://localhost/metrics?format=json");

    decision = resolver.resolve("/a/../health/.", "localhost");
    assert(decision.redirect);
    assert(decision.canonical_path == "/health");

    // Only the exact route name is exempt, not its subtree
    decision = resolver.resolve("/health/live", "localhost");
    assert(decision.redirect);
    assert(decision.canonical_path == "/health/live/");
    assert(!resolver.resolve("/healthz/", "localhost").redirect);
}

int main() {
    test_clean();
    test_pristine();
    test_fragment_and_canonical_path();
    test_options();
    test_pass_through();
    test_exempt_slash_forms();
    return 0;
}
