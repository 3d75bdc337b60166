#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

#include "ride_dispatch/allocation.hpp"
#include "ride_dispatch/config.hpp"
#include "ride_dispatch/entity_store.hpp"
#include "ride_dispatch/errors.hpp"
#include "ride_dispatch/json_codec.hpp"
#include "ride_dispatch/lifecycle.hpp"
#include "ride_dispatch/metrics.hpp"
#include "ride_dispatch/scheduler.hpp"

namespace ride_dispatch
{
namespace
{

using json = nlohmann::json;

void send_json(httplib::Response &res, const json &payload, int status = 200)
{
    res.status = status;
    res.set_content(payload.dump(), "application/json");
}

void send_error(httplib::Response &res, int status, const std::string &message)
{
    json error;
    error["status"] = "error";
    error["message"] = message;
    send_json(res, error, status);
}

// Runs a handler body and maps domain exceptions onto HTTP status codes.
void handle(httplib::Response &res, const std::function<void()> &body)
{
    try
    {
        body();
    }
    catch (const json::exception &ex)
    {
        send_error(res, 400, ex.what());
    }
    catch (const std::invalid_argument &ex)
    {
        send_error(res, 400, ex.what());
    }
    catch (const std::out_of_range &ex)
    {
        send_error(res, 400, ex.what());
    }
    catch (const NotFoundError &ex)
    {
        send_error(res, 404, ex.what());
    }
    catch (const InvalidTransitionError &ex)
    {
        send_error(res, 409, ex.what());
    }
    catch (const ConfigurationMissingError &ex)
    {
        send_error(res, 422, ex.what());
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Request failed: " << ex.what() << std::endl;
        send_error(res, 500, ex.what());
    }
}

json parse_body(const httplib::Request &req)
{
    if (req.body.empty())
    {
        return json::object();
    }
    return json::parse(req.body);
}

long ride_id_from(const httplib::Request &req)
{
    return std::stol(req.matches[1].str());
}

json ride_payload(const EntityStore &store, long ride_id)
{
    const auto ride = store.find_ride(ride_id);
    if (!ride)
    {
        throw NotFoundError("Ride", ride_id);
    }
    return json(*ride);
}

void register_query_routes(httplib::Server &server, EntityStore &store, DispatchScheduler &scheduler)
{
    server.Get("/api/health", [](const httplib::Request &, httplib::Response &res)
               { send_json(res, json{{"status", "ok"}}); });

    server.Get("/api/riders", [&store](const httplib::Request &, httplib::Response &res)
               { handle(res, [&]
                        { send_json(res, json(store.list_riders())); }); });

    server.Get("/api/drivers", [&store](const httplib::Request &, httplib::Response &res)
               { handle(res, [&]
                        { send_json(res, json(store.list_drivers())); }); });

    server.Get("/api/rides", [&store](const httplib::Request &, httplib::Response &res)
               { handle(res, [&]
                        { send_json(res, json(store.list_rides())); }); });

    server.Get("/api/rides/pending", [&store](const httplib::Request &, httplib::Response &res)
               { handle(res, [&]
                        { send_json(res, json(store.list_pending_rides())); }); });

    server.Get("/api/metrics", [&store, &scheduler](const httplib::Request &, httplib::Response &res)
               { handle(res, [&]
                        {
            json payload = compute_metrics(store);
            payload["dispatch"] = scheduler.stats();
            send_json(res, payload); }); });
}

void register_command_routes(httplib::Server &server, EntityStore &store, DispatchScheduler &scheduler, const AppConfig &config)
{
    server.Post("/api/riders", [&store](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]
                         {
            const auto body = parse_body(req);
            const long id = store.add_rider(body.value("name", "Rider"), geo_point_from_json(body));
            send_json(res, json(*store.find_rider(id)), 201); }); });

    server.Post("/api/drivers", [&store](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]
                         {
            const auto body = parse_body(req);
            const long id = store.add_driver(body.value("name", "Driver"), geo_point_from_json(body));
            send_json(res, json(*store.find_driver(id)), 201); }); });

    server.Post("/api/rides", [&store](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]
                         {
            const auto body = parse_body(req);
            if (!body.contains("rider_id") || !body["rider_id"].is_number_integer())
            {
                throw std::invalid_argument("Missing integer field 'rider_id'.");
            }
            const long id = store.create_ride(body["rider_id"].get<long>(),
                                              geo_point_from_json(body, "pickup"),
                                              geo_point_from_json(body, "drop"));
            std::cout << "Ride " << id << " requested by rider " << body["rider_id"].get<long>() << "." << std::endl;
            send_json(res, ride_payload(store, id), 201); }); });

    server.Post(R"(/api/rides/(\d+)/arrive)", [&store](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]
                         {
            const long id = ride_id_from(req);
            mark_driver_arrived(store, id, store.now());
            send_json(res, ride_payload(store, id)); }); });

    server.Post(R"(/api/rides/(\d+)/start)", [&store](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]
                         {
            const long id = ride_id_from(req);
            start_ride(store, id, store.now());
            send_json(res, ride_payload(store, id)); }); });

    server.Post(R"(/api/rides/(\d+)/end)", [&store, &config](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]
                         {
            const long id = ride_id_from(req);
            end_ride(store, id, store.now(), config.pricing_key);
            send_json(res, ride_payload(store, id)); }); });

    server.Post(R"(/api/rides/(\d+)/cancel)", [&store](const httplib::Request &req, httplib::Response &res)
                { handle(res, [&]
                         {
            const long id = ride_id_from(req);
            const auto body = parse_body(req);
            const auto source = parse_cancellation_source(body.value("by", "rider"));
            cancel_ride(store, id, store.now(), source);
            send_json(res, ride_payload(store, id)); }); });

    server.Post("/api/dispatch", [&scheduler](const httplib::Request &, httplib::Response &res)
                { handle(res, [&]
                         {
            const auto report = scheduler.run_once();
            if (!report)
            {
                send_json(res, json{{"status", "skipped"}}, 202);
                return;
            }
            json payload = *report;
            payload["status"] = "success";
            send_json(res, payload); }); });
}

} // namespace
} // namespace ride_dispatch

int main(int argc, char *argv[])
{
    using namespace ride_dispatch;

    AppConfig config;
    try
    {
        config = load_config(argc > 1 ? argv[1] : "config/ride_dispatch.json");
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }

    EntityStore store(config.eligibility);
    store.put_pricing_config(config.pricing_key, config.pricing);

    DispatchScheduler scheduler(store, config.dispatch);

    httplib::Server server;

    server.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res)
                                   {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (req.method == "OPTIONS")
        {
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled; });

    register_query_routes(server, store, scheduler);
    register_command_routes(server, store, scheduler, config);

    scheduler.start();

    std::cout << "Server starting on http://" << config.server.host << ":" << config.server.port << std::endl;
    if (!server.listen(config.server.host, config.server.port))
    {
        std::cerr << "Failed to bind " << config.server.host << ":" << config.server.port << std::endl;
        scheduler.stop();
        return 1;
    }

    scheduler.stop();
    return 0;
}
