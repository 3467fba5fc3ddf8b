#ifndef CLOUDGET_SERVICE_REGISTRY_HPP
#define CLOUDGET_SERVICE_REGISTRY_HPP

#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <cloudget/export.hpp>
#include <cloudget/service.hpp>

namespace cloudget
{
    using service_set = std::vector<std::shared_ptr<Service>>;

    // Ordered registry of services. Lookup by URL returns the first service
    // (in registration order) that supports it, so catch-all services must be
    // registered last.
    class CLOUDGET_API ServiceRegistry
    {
    public:
        ServiceRegistry() = default;

        // Creates and stores a new `ServiceType` IFF no service with the same name is
        // registered yet, returns null otherwise.
        template <typename ServiceType, typename... Args>
        auto create_unique_service(Args&&... args) -> std::shared_ptr<ServiceType>
        {
            static_assert(std::is_base_of_v<Service, ServiceType>);

            auto service = std::make_shared<ServiceType>(std::forward<Args>(args)...);
            if (!add_unique_service(service))
                return {};
            return service;
        }

        // Returns true if the service has been stored, false if the name was taken.
        bool add_unique_service(std::shared_ptr<Service> service);

        std::shared_ptr<Service> find_for_url(const std::string& url) const;
        std::shared_ptr<Service> get(std::string_view name) const;
        bool has_service(std::string_view name) const;

        const service_set& services() const noexcept
        {
            return m_services;
        }

        std::size_t size() const noexcept
        {
            return m_services.size();
        }

        bool empty() const noexcept
        {
            return m_services.empty();
        }

        void clear()
        {
            m_services.clear();
        }

        std::string to_string() const;

    private:
        service_set m_services;
    };

    // dropbox, gdrive, wetransfer, then the direct fallback.
    CLOUDGET_API void register_default_services(ServiceRegistry& registry);
}

#endif
