#include "ServiceManager.hpp"
#include <iostream>

namespace hearth::service
{
    ServiceManager::~ServiceManager()
    {
        StopAll();
    }

    bool ServiceManager::Register(std::shared_ptr<ThreadedService> service)
    {
        if (!service)
            return false;
        if (m_services.count(service->Name()))
        {
            std::cerr << "[Service] WARNING: " << service->Name() << " is already registered\n";
            return false;
        }
        m_services[service->Name()] = service;
        m_order.push_back(std::move(service));
        return true;
    }

    std::shared_ptr<ThreadedService> ServiceManager::Get(const std::string &name) const
    {
        auto it = m_services.find(name);
        if (it == m_services.end())
            return nullptr;
        return it->second;
    }

    std::vector<std::string> ServiceManager::StartAll()
    {
        std::vector<std::string> failed;
        for (const auto &service : m_order)
        {
            try
            {
                service->Start();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Service] ERROR: " << service->Name() << " failed to start: " << e.what() << "\n";
                failed.push_back(service->Name());
            }
        }
        return failed;
    }

    void ServiceManager::StopAll()
    {
        for (auto it = m_order.rbegin(); it != m_order.rend(); ++it)
            (*it)->Stop();
    }

    std::vector<ServiceHealth> ServiceManager::HealthCheck() const
    {
        std::vector<ServiceHealth> report;
        report.reserve(m_order.size());
        for (const auto &service : m_order)
            report.push_back(service->Health());
        return report;
    }
}
