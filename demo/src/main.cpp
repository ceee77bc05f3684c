/**
 * @file main.cpp
 *
 * This module holds the main() function, which is the entrypoint
 * to the LiveRocket demonstration server program.
 *
 * © 2018 by Richard Walters
 */

#include <chrono>
#include <LiveRocket/Server.hpp>
#include <LiveRocket/TcpServerTransport.hpp>
#include <memory>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <SystemAbstractions/DiagnosticsStreamReporter.hpp>
#include <thread>

namespace {

    /**
     * This flag is set by the signal handler to tell the program
     * to shut down.
     */
    volatile sig_atomic_t shutDown = 0;

    /**
     * This function is set up to be called when the SIGINT or SIGTERM
     * signal is received by the program.  It just sets the "shutDown"
     * flag and relies on the program to be polling the flag to detect
     * when it's been set.
     *
     * @param[in] sig
     *     This is the signal for which this function was called.
     */
    void InterruptHandler(int) {
        shutDown = 1;
    }

    /**
     * This function prints to the standard error stream information
     * about how to use this program.
     */
    void PrintUsageInformation() {
        fprintf(
            stderr,
            (
                "Usage: LiveRocketDemo [Key=Value ...]\n"
                "\n"
                "Run a small demonstration web application.\n"
                "\n"
                "  Key=Value  Set a server configuration item, such as\n"
                "             Host=0.0.0.0 or Port=8080.\n"
            )
        );
    }

    /**
     * This function registers the routes of the demonstration
     * application with the given server.
     *
     * @param[in,out] server
     *     This is the server with which to register the routes.
     */
    void RegisterRoutes(LiveRocket::Server& server) {
        (void)server.AddMiddleware(
            [](LiveRocket::Request& request){
                request.attributes["greeting"] = request.GetQueryParam("greeting", "Hello");
            }
        );
        (void)server.RegisterRoute(
            "/",
            "GET",
            [&server](
                const LiveRocket::Request& request,
                LiveRocket::Response& response,
                const LiveRocket::PathParameters& parameters
            ){
                response.SetContentType("text/html");
                response.Send(
                    "<h1>LiveRocket</h1>\n"
                    "<p>Try <a href=\"" + server.UrlFor("greet", {{"name", "World"}}) + "\">a greeting</a>.</p>"
                );
            },
            {},
            "index"
        );
        (void)server.RegisterRoute(
            "/greet/<name>",
            "GET",
            [](
                const LiveRocket::Request& request,
                LiveRocket::Response& response,
                const LiveRocket::PathParameters& parameters
            ){
                response.Send(request.attributes.at("greeting") + ", " + parameters.at("name").text + "!");
            },
            {},
            "greet"
        );
        (void)server.RegisterRoute(
            "/users/<int:id>",
            "GET",
            [](
                const LiveRocket::Request& request,
                LiveRocket::Response& response,
                const LiveRocket::PathParameters& parameters
            ){
                nlohmann::json user;
                user["id"] = parameters.at("id").integer;
                user["name"] = "user" + parameters.at("id").text;
                response.SetContentType("application/json");
                response.Send(user.dump());
            },
            {},
            "user"
        );
        (void)server.RegisterRoute(
            "/echo",
            "POST",
            [](
                const LiveRocket::Request& request,
                LiveRocket::Response& response,
                const LiveRocket::PathParameters& parameters
            ){
                response.SetContentType("application/json");
                response.Send(request.data.dump());
            }
        );
        (void)server.RegisterRoute(
            "/old-home",
            "GET",
            [&server](
                const LiveRocket::Request& request,
                LiveRocket::Response& response,
                const LiveRocket::PathParameters& parameters
            ){
                response.Redirect(server.UrlFor("index"), true);
            }
        );
    }

}

/**
 * This function is the entrypoint of the program.
 *
 * @param[in] argc
 *     This is the number of command-line arguments given to the program.
 *
 * @param[in] argv
 *     This is the array of command-line arguments given to the program.
 */
int main(int argc, char* argv[]) {
    LiveRocket::Server server;
    const auto diagnosticsPublisher = SystemAbstractions::DiagnosticsStreamReporter(stdout, stderr);
    const auto unsubscribeServerDiagnostics = server.SubscribeToDiagnostics(diagnosticsPublisher);
    for (int i = 1; i < argc; ++i) {
        const std::string argument(argv[i]);
        const auto delimiter = argument.find('=');
        if (
            (delimiter == std::string::npos)
            || (delimiter == 0)
        ) {
            PrintUsageInformation();
            unsubscribeServerDiagnostics();
            return EXIT_FAILURE;
        }
        server.SetConfigurationItem(
            argument.substr(0, delimiter),
            argument.substr(delimiter + 1)
        );
    }
    RegisterRoutes(server);
    const auto transport = std::make_shared< LiveRocket::TcpServerTransport >();
    const auto unsubscribeTransportDiagnostics = transport->SubscribeToDiagnostics(diagnosticsPublisher);
    LiveRocket::Server::MobilizationDependencies deps;
    deps.transport = transport;
    if (!server.Mobilize(deps)) {
        fprintf(stderr, "error: unable to start server\n");
        unsubscribeTransportDiagnostics();
        unsubscribeServerDiagnostics();
        return EXIT_FAILURE;
    }
    const auto previousInterruptHandler = signal(SIGINT, InterruptHandler);
    const auto previousTerminateHandler = signal(SIGTERM, InterruptHandler);
    printf("Server running; press <Ctrl>+<C> to stop.\n");
    while (!shutDown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    (void)signal(SIGINT, previousInterruptHandler);
    (void)signal(SIGTERM, previousTerminateHandler);
    printf("Shutting down...\n");
    server.Demobilize();
    unsubscribeTransportDiagnostics();
    unsubscribeServerDiagnostics();
    return EXIT_SUCCESS;
}
