#pragma once

#include <optional>
#include <string>
#include <utility>

namespace timekeep {

// Outcome of one OS probe: either a known value or Unavailable with a reason.
// Probes report failures through this type instead of throwing.
template <typename T>
class ProbeResult
{
public:
    static ProbeResult known(T value)
    {
        ProbeResult result;
        result.m_value = std::move(value);
        return result;
    }

    static ProbeResult unavailable(std::string reason)
    {
        ProbeResult result;
        result.m_reason = std::move(reason);
        return result;
    }

    bool isKnown() const { return m_value.has_value(); }
    const T &value() const { return *m_value; }
    const std::string &reason() const { return m_reason; }

private:
    ProbeResult() = default;

    std::optional<T> m_value;
    std::string m_reason;
};

class ActiveWindowProbe
{
public:
    virtual ~ActiveWindowProbe() = default;
    // Foreground application identifier. The "Unknown" sentinel and empty
    // titles are reported as unavailable.
    virtual ProbeResult<std::string> activeWindow() = 0;
};

class IdleProbe
{
public:
    virtual ~IdleProbe() = default;
    virtual ProbeResult<double> idleSeconds() = 0;
};

// X11 implementation backed by `xdotool getactivewindow getwindowname`.
class XdotoolWindowProbe : public ActiveWindowProbe
{
public:
    ProbeResult<std::string> activeWindow() override;
};

// X11 implementation backed by `xprintidle`, which prints milliseconds.
class XprintidleProbe : public IdleProbe
{
public:
    ProbeResult<double> idleSeconds() override;
};

} // namespace timekeep
