#include "core/TrayIconBuilder.hpp"
#include "core/TrayError.hpp"
#include "core/Logger.hpp"
#include "utils/ConfigManager.hpp"
#include <QApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDir>
#include <QFile>
#include <iostream>
#include <optional>

using namespace tray_icon;

namespace {

enum class DemoSignal {
    ToggleTooltip,
    ShowDetails,
    Verbose,
    Quit
};

std::string toString(DemoSignal signal) {
    switch (signal) {
        case DemoSignal::ToggleTooltip: return "ToggleTooltip";
        case DemoSignal::ShowDetails:   return "ShowDetails";
        case DemoSignal::Verbose:       return "Verbose";
        case DemoSignal::Quit:          return "Quit";
        default:                        return "Unknown";
    }
}

}

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("Tray icon demo");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"
    );
    parser.addOption(configOption);

    QCommandLineOption logFileOption(
        QStringList() << "l" << "log-file",
        "Specify log file path.",
        "log-file"
    );
    parser.addOption(logFileOption);

    QCommandLineOption logLevelOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level",
        "1"
    );
    parser.addOption(logLevelOption);
}

void initializeLogger(const QCommandLineParser& parser, const ConfigManager& config) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }

    int level = parser.isSet("verbosity")
        ? parser.value("verbosity").toInt()
        : config.getInt("logLevel", 1);
    logger.setLogLevel(Logger::levelFromInt(level));

    TRAY_LOG_INFO("Application starting...");
}

bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    QString configPath;

    if (parser.isSet("config")) {
        configPath = parser.value("config");
    } else {
        QStringList configLocations = {
            QDir::currentPath() + "/tray-demo.json",
            QDir::homePath() + "/.config/tray-icon/tray-demo.json",
            "/etc/tray-icon/tray-demo.json"
        };

        for (const auto& path : configLocations) {
            if (QFile::exists(path)) {
                configPath = path;
                break;
            }
        }
    }

    if (!configPath.isEmpty()) {
        if (!config.loadFromFile(configPath.toStdString())) {
            std::cerr << "Failed to load configuration from "
                      << configPath.toStdString() << std::endl;
            return false;
        }
    }

    return true;
}

Menu<DemoSignal> createMenu(bool verbose) {
    using Item = MenuItem<DemoSignal>;
    return Menu<DemoSignal>{
        Item::button("Toggle tooltip", DemoSignal::ToggleTooltip),
        Item::separator(),
        Item::menu("Options", {
            Item::button("Show details", DemoSignal::ShowDetails),
            Item::button("Verbose logging", DemoSignal::Verbose, verbose)
        }),
        Item::separator(),
        Item::button("Quit", DemoSignal::Quit)
    };
}

int main(int argc, char *argv[]) {
    try {
        QApplication app(argc, argv);
        app.setApplicationName("Tray Demo");
        app.setApplicationVersion("1.0.0");
        app.setQuitOnLastWindowClosed(false);

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        ConfigManager config;
        if (!loadConfiguration(config, parser)) {
            return 1;
        }
        initializeLogger(parser, config);

        const std::string tooltip = config.getString("tooltip", "Tray demo");
        const bool notifyOnClick = config.getBool("notifyOnClick", false);
        bool verbose = Logger::instance().logLevel() == LogLevel::Debug;

        std::optional<TrayIcon<DemoSignal>> tray;

        auto callback = [&](const TrayEvent<DemoSignal>& event) {
            if (event.isTray()) {
                TRAY_LOG_INFO("Tray clicked: " + toString(event.click()));
                if (notifyOnClick && event.click() == ClickType::Left) {
                    TRAY_LOG_INFO("Left click notifications are enabled");
                }
                return;
            }

            TRAY_LOG_INFO("Menu selected: " + toString(event.signal()));
            try {
                switch (event.signal()) {
                    case DemoSignal::ToggleTooltip:
                        tray->setTooltip(tray->tooltip()
                            ? std::nullopt
                            : std::optional<std::string>(tooltip));
                        break;

                    case DemoSignal::ShowDetails:
                        TRAY_LOG_INFO("Tray id " + std::to_string(tray->trayId()) +
                                      ", tooltip: " + tray->tooltip().value_or("<none>"));
                        break;

                    case DemoSignal::Verbose:
                        verbose = !verbose;
                        Logger::instance().setLogLevel(
                            verbose ? LogLevel::Debug : LogLevel::Info);
                        tray->setMenu(createMenu(verbose));
                        break;

                    case DemoSignal::Quit:
                        QCoreApplication::quit();
                        break;
                }
            } catch (const TrayError& e) {
                TRAY_LOG_ERROR(std::string("Tray update failed: ") + e.what());
            }
        };

        tray = TrayIconBuilder<DemoSignal>()
            .withTooltip(tooltip)
            .withIcon(config.getString("iconPath"))
            .withMenu(createMenu(verbose))
            .build(callback);

        TRAY_LOG_INFO("Application initialized successfully");

        int result = app.exec();

        // Must go before the QApplication that parents the native surface
        tray.reset();
        return result;

    } catch (const TrayError& e) {
        std::cerr << "Failed to create tray icon: " << e.what() << std::endl;
        TRAY_LOG_CRITICAL("Failed to create tray icon: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        TRAY_LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
