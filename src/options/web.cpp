// options/web.cpp
//
// HTTP listener settings.

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include "options.hpp"
#include "parse_utils.hpp"

void parse_web_options(Options& opts, const OptionSource& src) {
    bool ok = false;
    if (auto v = src.value("--address")) {
        if (v->empty())
            throw std::runtime_error("Invalid value for --address");
        opts.web.address = *v;
    }
    if (auto v = src.value("--port")) {
        unsigned int port = parse_uint(*v, 1, std::numeric_limits<uint16_t>::max(), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --port");
        opts.web.port = static_cast<uint16_t>(port);
    }
    if (auto v = src.value("--workers")) {
        opts.web.workers = parse_size_t(*v, 1, 1024, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --workers");
    }
    if (auto v = src.value("--request-timeout")) {
        auto dur = parse_duration(*v, ok);
        if (!ok || dur.count() < 1)
            throw std::runtime_error("Invalid value for --request-timeout");
        opts.web.request_timeout = dur;
    }
    opts.web.listing = !src.flag("--no-listing");
}
