/**
 * @file main.cpp
 * @brief This is an example of how to use impcurl to perform asynchronous (i.e. non-blocking) network transfers.
 * To do so, we will use the event-driven interface of impcurl.
 * Basically, the workflow is supposed to look like this :
 * <ul>
 * <li>1 - Setup a session to hold the transfers (\see impcurl::mhandle) </li>
 * <li>2 - Setup one or more single transfer (\see impcurl::handle), or requests (\see impcurl::client) </li>
 * <li>3 - Add your transfers to the session and let your loop do the magic </li>
 * </ul>
 *
 * In this example, we download a page 5 times with the same transfer, while requesting a few others in parallel.
 */

#include <Loop.h>
#include <impcurl/impcurl.hpp>

#include <curl/curl.h> // Convenient to get access to handle options (CURLOPT)
#include <fstream>     // Write to file
#include <iostream>
#include <signal.h>
#include <string.h>

using namespace impcurl;
using namespace loop;

#define OUTPUT_FILENAME "nonblocking_output"
#define URL "https://example.com"

int
main()
{
    // 0 - We setup everything we need
    Loop myLoop;

    auto sigintEvt = Loop::UNIX_SIGNAL(SIGINT, myLoop);
    sigintEvt.onEvent([&myLoop](int) {
        std::cout << strsignal(SIGINT) << std::endl;
        myLoop.exit();
    });

    auto sigtermEvt = Loop::UNIX_SIGNAL(SIGTERM, myLoop);
    sigtermEvt.onEvent([&myLoop](int) {
        std::cout << strsignal(SIGTERM) << std::endl;
        myLoop.exit();
    });

    std::ofstream outputFile{ OUTPUT_FILENAME, std::ios_base::out | std::ios_base::trunc };
    if (!outputFile.is_open())
    {
        std::cerr << "Unable to create output file '" << OUTPUT_FILENAME << std::endl;
        return EXIT_FAILURE;
    }

    // 1 - Setup our session
    mhandle sess{ myLoop };
    sess.set_max_host_connections(4);

    int inflight{ 0 };
    auto done = [&inflight, &myLoop]() {
        if (0 == --inflight) myLoop.exit();
    };

    // 2 - Setup our transfer, re-added each time it completes
    handle hdl;
    hdl.set_cb_write([&outputFile](const char* buff, size_t sz) -> size_t {
        outputFile.write(buff, sz);
        return sz;
    });
    hdl.set_opt(CURLOPT_HTTPGET, 1L);
    hdl.set_opt(CURLOPT_URL, std::string(URL));
    hdl.set_opt(CURLOPT_VERBOSE, 0L);

    int                               i{ 0 };
    std::function<void(handle&)>      on_success;
    std::function<void(std::exception_ptr)> on_failure = [&done](std::exception_ptr e) {
        try
        {
            std::rethrow_exception(e);
        }
        catch (const error& err)
        {
            std::cout << "[FAILED] - " << err.what() << std::endl;
        }
        done();
    };
    on_success = [&](handle& h) {
        std::cout << "[DONE][" << i << "] - HTTP " << h.get_info_long(CURLINFO_RESPONSE_CODE) << std::endl;

        if (i++ < 5)
            sess.add_handle(h, on_success, on_failure);
        else
        {
            outputFile.close();
            done();
        }
    };

    // 3 - Perform our transfer by adding it to the session
    ++inflight;
    sess.add_handle(hdl, on_success, on_failure);

    // 4 - And a few requests along the way
    client cli{ sess };
    for (const auto* profile : { "chrome110", "firefox109", "safari15_5" })
    {
        request_options opts;
        opts.url         = URL;
        opts.impersonate = profile;

        ++inflight;
        cli.request(
          opts,
          [&done, profile](response res) {
              std::cout << "[" << profile << "] " << res.status << " " << res.status_text << " - "
                        << res.body.size() << " bytes" << std::endl;
              done();
          },
          on_failure);
    }

    myLoop.run();

    return EXIT_SUCCESS;
}
