#include "CANBridge/Util/Logger.hpp"
#include "CANBridge/Config.hpp"

#include <string>

namespace CANBridge::Util
{
    xtr::logger& logger()
    {
        static xtr::logger instance;
        return instance;
    }

    xtr::sink make_sink(const std::string_view component, const std::string_view channel)
    {
        std::string name = "CANBridge ";
        name += component;
        if (!channel.empty())
        {
            name += '_';
            name += channel;
        }
        xtr::sink s = logger().get_sink(name);
        s.set_level(Config::get_log_level());
        return s;
    }
}
