#include <cloudget/service_registry.hpp>
#include <cloudget/services/direct.hpp>
#include <cloudget/services/dropbox.hpp>
#include <cloudget/services/gdrive.hpp>
#include <cloudget/services/wetransfer.hpp>

namespace cloudget
{
    bool ServiceRegistry::add_unique_service(std::shared_ptr<Service> service)
    {
        if (!service || has_service(service->name()))
            return false;
        m_services.push_back(std::move(service));
        return true;
    }

    std::shared_ptr<Service> ServiceRegistry::find_for_url(const std::string& url) const
    {
        for (const auto& service : m_services)
        {
            if (service->supports(url))
                return service;
        }
        return {};
    }

    std::shared_ptr<Service> ServiceRegistry::get(std::string_view name) const
    {
        for (const auto& service : m_services)
        {
            if (service->name() == name)
                return service;
        }
        return {};
    }

    bool ServiceRegistry::has_service(std::string_view name) const
    {
        return get(name) != nullptr;
    }

    std::string ServiceRegistry::to_string() const
    {
        std::string result;
        for (const auto& service : m_services)
        {
            result += std::string(service->name()) + " (" + std::string(service->display_name())
                      + ")\n";
        }
        return result;
    }

    void register_default_services(ServiceRegistry& registry)
    {
        registry.create_unique_service<DropboxService>();
        registry.create_unique_service<GoogleDriveService>();
        registry.create_unique_service<WeTransferService>();
        registry.create_unique_service<DirectService>();
    }
}
