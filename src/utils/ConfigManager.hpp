#pragma once
#include <QObject>
#include <memory>
#include <string>
#include <variant>
#include <map>

namespace tray_icon {

using ConfigValue = std::variant<bool, int, double, std::string>;

class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    bool contains(const std::string& key) const;

    void setBool(const std::string& key, bool value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setString(const std::string& key, const std::string& value);

    // JSON file of the form {"global": {"key": value, ...}}
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    void resetToDefaults();

signals:
    void configChanged(const std::string& key);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
