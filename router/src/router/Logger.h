/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _WAYFINDER_ROUTER_LOGGER_H_
#define _WAYFINDER_ROUTER_LOGGER_H_

#include <string>
#include <ostream>
#include <mutex>

namespace wayfinder { namespace router {
    class Logger {
    public:
        enum class Severity {
            INFO, WARNING, ERROR
        };

        virtual ~Logger() = default;

        virtual void write(Severity severity, const std::string& msg) = 0;
    };

    class StreamLogger final : public Logger {
    public:
        StreamLogger() = delete;
        explicit StreamLogger(std::ostream& stream) : _stream(stream) { }

        virtual void write(Severity severity, const std::string& msg) override;

        static const char* getSeverityName(Severity severity);

    private:
        std::ostream& _stream;
        std::mutex _mutex;
    };
} }

#endif
