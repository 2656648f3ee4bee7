/**
 * @file main.cpp
 * @brief This is an example of how to use impcurl to perform blocking network transfers.
 * <ul>
 * <li>1 - With a raw transfer (\see impcurl::handle) </li>
 * <li>2 - With the request layer, that follows redirects and builds a response (\see impcurl::request) </li>
 * </ul>
 */

#include <impcurl/impcurl.hpp>
#include <iostream>

#include <curl/curl.h>

using namespace impcurl;

#define URL "http://www.google.com"

int
main()
{
    // 1 - A single transfer
    handle hdl;

    hdl.set_cb_write([](const char*, size_t sz) -> size_t {
        std::cout << "write... " << sz << " bytes\n";
        return sz;
    });
    hdl.set_opt(CURLOPT_HTTPGET, 1L);
    hdl.set_opt(CURLOPT_URL, std::string(URL));
    hdl.set_opt(CURLOPT_VERBOSE, 0L);

    auto rc{ hdl.perform() };
    std::cout << "DONE : '" << handle::strerror(rc) << "' - HTTP " << hdl.get_info_long(CURLINFO_RESPONSE_CODE)
              << "\n";

    // 2 - A request, looking like Firefox
    request_options opts;
    opts.impersonate = "firefox109";
    opts.params      = { { "q", "impcurl" } };

    try
    {
        auto res{ get(URL, opts) };
        std::cout << res.status << " " << res.status_text << " - " << res.url << " after " << res.redirect_count
                  << " redirect(s), " << res.body.size() << " bytes\n";
        for (const auto& [name, value] : res.headers)
            std::cout << "  " << name << ": " << value << "\n";
    }
    catch (const error& e)
    {
        std::cerr << "Request failed: " << e.what() << " (" << e.code() << ")\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
