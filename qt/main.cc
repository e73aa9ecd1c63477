#include "console_renderer.hh"
#include "navigation_config.hh"
#include "navigation_state.hh"
#include "navigator.hh"
#include "position_feed.hh"
#include "route_replay_source.hh"
#include "route_service.hh"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTimer>
#include <fmt/format.h>

int
main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("navtrack_replay");

    QCommandLineParser parser;
    parser.setApplicationDescription("Replay an OSRM route response through the route tracker");
    parser.addHelpOption();
    parser.addPositionalArgument("route", "OSRM route/v1 response (geojson geometry, steps=true)");

    QCommandLineOption vehicle_option("vehicle", "Assume 50 km/h when the fix has no speed");
    QCommandLineOption min_movement_option(
        "min-movement", "Ignore fixes closer than <meters> to the last one", "meters", "5");
    QCommandLineOption maneuver_radius_option(
        "maneuver-radius", "Announce maneuvers closer than <meters>", "meters", "30");
    QCommandLineOption interval_option(
        "interval", "Time between replayed fixes", "milliseconds", "1000");
    QCommandLineOption speed_option("speed", "Replayed speed, 0 for none", "m/s", "0");
    QCommandLineOption log_option("log-positions", "Log every accepted position update");

    parser.addOptions({vehicle_option,
                       min_movement_option,
                       maneuver_radius_option,
                       interval_option,
                       speed_option,
                       log_option});
    parser.process(app);

    if (parser.positionalArguments().size() != 1)
    {
        parser.showHelp(1);
    }

    auto config = parser.isSet(vehicle_option) ? NavigationConfig::Vehicle() : NavigationConfig {};
    config.min_movement_meters = parser.value(min_movement_option).toDouble();
    config.maneuver_radius_meters = parser.value(maneuver_radius_option).toDouble();

    auto interval = milliseconds(parser.value(interval_option).toUInt());
    auto speed = parser.value(speed_option).toFloat();

    auto route_file = parser.positionalArguments().front();
    QFile file(route_file);
    if (!file.open(QIODevice::ReadOnly))
    {
        fmt::print(stderr, "Failed to open {}\n", route_file.toStdString());
        return 1;
    }
    auto response = file.readAll().toStdString();

    NavigationState state;
    RouteService route_service;

    auto replay = std::make_unique<RouteReplaySource>(
        route_service.AttachListener(), interval, speed);
    auto feed = std::make_unique<PositionFeed>(*replay, config.fallback_fix_timeout);
    auto navigator =
        std::make_unique<Navigator>(state, *feed, route_service.AttachListener(), config);
    auto renderer = std::make_unique<ConsoleRenderer>(state);

    // Queued before the threads run, so the route is in place before the start command
    route_service.PublishOsrmResponse(response);
    navigator->SetPositionLogging(parser.isSet(log_option));
    navigator->StartNavigation();

    renderer->Start("renderer");
    navigator->Start("navigator");
    feed->Start("position_feed");
    replay->Start("route_replay");

    QTimer done_timer;
    QObject::connect(&done_timer, &QTimer::timeout, [&]() {
        auto snapshot = state.CheckoutReadonly();

        if (snapshot->last_error == NavigationState::Error::kNoRoute)
        {
            QCoreApplication::exit(1);
        }
        else if (replay->Finished())
        {
            navigator->StopNavigation();
            QCoreApplication::exit(0);
        }
    });
    done_timer.start(interval.count());

    auto rv = QCoreApplication::exec();

    // The navigator holds a port into the feed, and the feed reads from the replay
    for (os::BaseThread* thread : std::initializer_list<os::BaseThread*> {
             navigator.get(), feed.get(), replay.get(), renderer.get()})
    {
        thread->StopAndWait();
    }

    navigator = nullptr;
    feed = nullptr;
    replay = nullptr;
    renderer = nullptr;

    return rv;
}
