#include "SafeRoute/Engine/ProfileStore.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <set>

namespace SafeRoute
{
    void ValidateProfileName(const std::string &name)
    {
        if (name.empty())
        {
            throw ConfigInvalid("profile name is empty");
        }
        if (name.find('/') != std::string::npos || name.find('\0') != std::string::npos)
        {
            throw ConfigInvalid("profile name contains '/': " + name);
        }
    }

    ProfileStore::ProfileStore(ProfileRepository &repo)
        : repo_(repo), profiles_(repo.LoadProfiles())
    {
        LOGD("store") << "Loaded " << profiles_.size() << " profile(s)";
    }

    std::uint32_t ProfileStore::NextTableId() const
    {
        std::set<std::uint32_t> used;
        for (const auto &kv : profiles_)
        {
            used.insert(kv.second.table_id);
        }

        std::uint32_t id = kTableIdBase;
        while (used.count(id))
        {
            ++id;
        }
        return id;
    }

    TunnelProfile ProfileStore::Import(const std::string &path, const std::string &name)
    {
        ValidateProfileName(name);
        if (profiles_.count(name))
        {
            throw Conflict("profile already exists: " + name);
        }

        // Разбор до любых изменений: при ошибке реестр не трогаем
        const TunnelDefinition def = LoadTunnelDefinition(path);

        TunnelProfile p;
        p.name            = name;
        p.table_id        = NextTableId();
        p.interface_name  = DeriveInterfaceName(name);
        p.peer_public_key = def.peer_public_key;
        p.endpoint_host   = def.endpoint_host;
        p.endpoint_port   = def.endpoint_port;
        p.allowed_ips     = def.allowed_ips;
        p.local_address   = def.local_address;
        p.dns_servers     = def.dns_servers;

        for (const auto &kv : profiles_)
        {
            if (kv.second.interface_name == p.interface_name)
            {
                throw Conflict("interface name " + p.interface_name + " already used by " + kv.first);
            }
        }

        p.definition_path = repo_.StoreDefinition(name, path);

        profiles_[name] = p;
        try
        {
            repo_.SaveProfiles(profiles_);
        }
        catch (const std::exception &e)
        {
            LOGE("store") << "Import " << name << ": persist failed: " << e.what();
            profiles_.erase(name);
            repo_.RemoveDefinition(name);
            throw;
        }

        LOGI("store") << "Imported profile " << name << " table=" << p.table_id
                      << " if=" << p.interface_name << " endpoint=" << p.endpoint_host
                      << ":" << p.endpoint_port;
        return p;
    }

    void ProfileStore::Delete(const std::string &name)
    {
        auto it = profiles_.find(name);
        if (it == profiles_.end())
        {
            throw NotFound("no such profile: " + name);
        }

        const TunnelProfile removed = it->second;
        profiles_.erase(it);
        try
        {
            repo_.SaveProfiles(profiles_);
        }
        catch (const std::exception &)
        {
            profiles_[name] = removed;
            throw;
        }
        repo_.RemoveDefinition(name);

        LOGI("store") << "Deleted profile " << name << " (table " << removed.table_id << " released)";
    }

    void ProfileStore::SetPin(const std::string &name, const std::optional<EndpointPin> &pin)
    {
        auto it = profiles_.find(name);
        if (it == profiles_.end())
        {
            throw NotFound("no such profile: " + name);
        }
        if (it->second.pin == pin) return;

        it->second.pin = pin;
        try
        {
            repo_.SaveProfiles(profiles_);
        }
        catch (const std::exception &e)
        {
            // маршрут уже в ядре; в памяти запись остаётся верной
            LOGW("store") << "Pin of " << name << " not persisted: " << e.what();
        }
    }

    std::optional<TunnelProfile> ProfileStore::Get(const std::string &name) const
    {
        auto it = profiles_.find(name);
        if (it == profiles_.end()) return std::nullopt;
        return it->second;
    }

    const TunnelProfile &ProfileStore::Require(const std::string &name) const
    {
        auto it = profiles_.find(name);
        if (it == profiles_.end())
        {
            throw NotFound("no such profile: " + name);
        }
        return it->second;
    }

    bool ProfileStore::Contains(const std::string &name) const
    {
        return profiles_.count(name) != 0;
    }

    std::vector<TunnelProfile> ProfileStore::List() const
    {
        std::vector<TunnelProfile> out;
        out.reserve(profiles_.size());
        for (const auto &kv : profiles_)
        {
            out.push_back(kv.second);
        }
        return out;
    }

    TunnelDefinition ProfileStore::LoadDefinition(const TunnelProfile &profile) const
    {
        return LoadTunnelDefinition(profile.definition_path);
    }
} // namespace SafeRoute
