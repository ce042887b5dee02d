#include <cassert>
#include <string>
#include <crow.h>
#include "../../src/middleware/clean_path.h"
#include "../../src/observability/metrics.h"
#include "../../src/utils/config.h"

using namespace cleanpath;

static crow::request make_request(const std::string& target) {
    crow::request req;
    req.raw_url = target;
    req.url = target.substr(0, target.find('?'));
    req.add_header("Host", "localhost");
    return req;
}

int main() {
    Config::instance().reset();
    Metrics::instance().reset();

    CleanPath middleware;
    CleanPath::context ctx;

    {
        crow::request req = make_request("//a//b//?a=1");
        crow::response res;
        middleware.before_handle(req, res, ctx);
        assert(res.is_completed());
        assert(res.code == 308);
        assert(res.get_header_value("Location") == "http://localhost/a/b/?a=1");
        middleware.after_handle(req, res, ctx);
    }

    {
        crow::request req = make_request("/a/b/");
        crow::response res;
        middleware.before_handle(req, res, ctx);
        assert(!res.is_completed());
        assert(res.get_header_value("Location").empty());
        middleware.after_handle(req, res, ctx);
    }

    // Both requests were timed from before_handle to after_handle
    assert(Metrics::instance().to_prometheus().find("# TYPE request_duration_us_max gauge") != std::string::npos);

    assert(Metrics::instance().get_counter("clean_path_redirects_total") == 1);
    assert(Metrics::instance().get_counter("clean_path_passthrough_total") == 1);

    // 301 and disabled middleware
    CleanPathOptions options;
    options.redirect_status = 301;
    middleware.configure(options);
    {
        crow::request req = make_request("/m.");
        crow::response res;
        middleware.before_handle(req, res, ctx);
        assert(res.code == 301);
        assert(res.get_header_value("Location") == "http://localhost/m./");
    }

    middleware.configure(options, false);
    {
        crow::request req = make_request("//");
        crow::response res;
        middleware.before_handle(req, res, ctx);
        assert(!res.is_completed());
    }

    return 0;
}
