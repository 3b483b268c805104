#pragma once

#include <string>

namespace timekeep {

class ConfigStore;

class Notifier
{
public:
    virtual ~Notifier() = default;
    // Best effort; implementations must not throw.
    virtual void notify(const std::string &title, const std::string &message) = 0;
};

// Desktop notifications through notify-send. Honors notifications_enabled.
class DesktopNotifier : public Notifier
{
public:
    explicit DesktopNotifier(const ConfigStore &config);

    void notify(const std::string &title, const std::string &message) override;

private:
    const ConfigStore &m_config;
};

} // namespace timekeep
