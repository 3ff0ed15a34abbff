//*****************************************************************************
// Copyright 2025 Intel Corporation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//*****************************************************************************
#pragma once

#include <chrono>
#include <string>

#include "server_settings.hpp"

namespace mserve {

/**
     * @brief Provides all the configuration options from command line
     */
class Config {
protected:
    /**
         * @brief A default constructor is private
         */
    Config() = default;

private:
    /**
         * @brief Private copying constructor
         */
    Config(const Config&) = delete;

    ServerSettings serverSettings;

public:
    /**
         * @brief Gets the instance of the config
         */
    static Config& instance() {
        static Config instance;

        return instance;
    }

    /**
         * @brief Parse the commandline parameters, exits the process on help, version or invalid values
         * 
         * @param argc 
         * @param argv 
         * @return Config& 
         */
    Config& parse(int argc, char** argv);
    bool parse(ServerSettings*);

    /**
         * @brief Validate passed arguments
         * 
         * @return bool 
         */
    bool validate();

    /**
         * @brief checks if input is a proper hostname or IP address value
         *
         * @return bool
         */
    static bool check_hostname_or_ip(const std::string& input);

    uint32_t restPort() const;
    const std::string& restBindAddress() const;

    /**
         * @brief Gets the rest workers count, number of cores unless set
         * 
         * @return uint32_t
         */
    uint32_t restWorkers() const;

    const std::string& logLevel() const;
    const std::string& logPath() const;

    bool metricsEnabled() const;
    const std::string& metricsList() const;
    const std::string& metricsBuckets() const;

    uint32_t degradedThreshold() const;
    std::chrono::seconds degradedWindow() const;
    std::chrono::seconds loadTimeout() const;

private:
    static bool is_ipv6(const std::string& s);
};

}  // namespace mserve
