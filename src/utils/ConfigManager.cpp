#include "ConfigManager.hpp"
#include "Overloaded.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <cmath>

namespace tray_icon {

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> globalSettings;

    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double d) -> QJsonValue { return d; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    ConfigValue fromJsonValue(const QJsonValue& json) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                return json.toBool();
            case QJsonValue::Double: {
                double number = json.toDouble();
                if (std::floor(number) == number &&
                    std::abs(number) <= 2147483647.0) {
                    return static_cast<int>(number);
                }
                return number;
            }
            case QJsonValue::String:
                return json.toString().toStdString();
            default:
                return false;
        }
    }

    template <typename T>
    T get(const std::string& key, const T& defaultValue) const {
        auto it = globalSettings.find(key);
        if (it != globalSettings.end() && std::holds_alternative<T>(it->second)) {
            return std::get<T>(it->second);
        }
        return defaultValue;
    }

    void setDefaults() {
        globalSettings = {
            {"tooltip", std::string("Tray demo")},
            {"iconPath", std::string()},
            {"logLevel", 1},
            {"notifyOnClick", false}
        };
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    return d->get<bool>(key, defaultValue);
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    return d->get<int>(key, defaultValue);
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end() && std::holds_alternative<int>(it->second)) {
        return std::get<int>(it->second);
    }
    return d->get<double>(key, defaultValue);
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return d->get<std::string>(key, defaultValue);
}

bool ConfigManager::contains(const std::string& key) const {
    return d->globalSettings.count(key) != 0;
}

void ConfigManager::setBool(const std::string& key, bool value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setDouble(const std::string& key, double value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->globalSettings[key] = value;
    emit configChanged(key);
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (doc.isNull() || !doc.isObject()) {
        return false;
    }

    QJsonObject globals = doc.object()["global"].toObject();
    for (auto it = globals.begin(); it != globals.end(); ++it) {
        std::string key = it.key().toStdString();
        d->globalSettings[key] = d->fromJsonValue(it.value());
        emit configChanged(key);
    }

    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject globals;
    for (const auto& [key, value] : d->globalSettings) {
        globals[QString::fromStdString(key)] = d->toJsonValue(value);
    }

    QJsonObject root;
    root["global"] = globals;

    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }

    return file.write(QJsonDocument(root).toJson()) >= 0;
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();

    for (const auto& [key, _] : d->globalSettings) {
        emit configChanged(key);
    }
}

}
