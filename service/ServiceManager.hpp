#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "ThreadedService.hpp"

namespace hearth::service
{
    class ServiceManager
    {
    public:
        ServiceManager() = default;
        ~ServiceManager();

        ServiceManager(const ServiceManager &) = delete;
        ServiceManager &operator=(const ServiceManager &) = delete;

        // False when the name is taken or the service is null.
        bool Register(std::shared_ptr<ThreadedService> service);
        std::shared_ptr<ThreadedService> Get(const std::string &name) const;

        // Starts in registration order. A service whose start throws is
        // logged and skipped; returns the names that failed.
        std::vector<std::string> StartAll();

        // Stops in reverse registration order.
        void StopAll();

        std::vector<ServiceHealth> HealthCheck() const;

    private:
        std::vector<std::shared_ptr<ThreadedService>> m_order;
        std::unordered_map<std::string, std::shared_ptr<ThreadedService>> m_services;
    };
}
