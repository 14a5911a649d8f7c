#include "SafeRoute/Store/TunnelDefinition.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Kernel/Resolver.hpp"
#include "SafeRoute/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace SafeRoute
{
    namespace
    {
        bool Whitespace(char ch)
        {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        }

        std::string_view Trim(std::string_view s)
        {
            while (!s.empty() && Whitespace(s.front())) s.remove_prefix(1);
            while (!s.empty() && Whitespace(s.back()))  s.remove_suffix(1);
            return s;
        }

        std::string Lower(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        // "10.2.0.2/32" | "10.2.0.2" -> "10.2.0.2/32"
        std::string NormalizeCidr(const std::string &raw, const std::string &origin)
        {
            std::string addr = raw;
            std::string prefix;
            if (auto slash = raw.find('/'); slash != std::string::npos)
            {
                addr   = raw.substr(0, slash);
                prefix = raw.substr(slash + 1);
            }
            if (!IsIpLiteral(addr))
            {
                throw ConfigInvalid(origin + ": invalid address '" + raw + "'");
            }
            const bool v6  = addr.find(':') != std::string::npos;
            const int  max = v6 ? 128 : 32;
            if (prefix.empty())
            {
                return addr + "/" + std::to_string(max);
            }
            if (!std::all_of(prefix.begin(), prefix.end(), [](unsigned char c) { return std::isdigit(c); })
                || prefix.size() > 3 || std::stoi(prefix) > max)
            {
                throw ConfigInvalid(origin + ": invalid prefix in '" + raw + "'");
            }
            return addr + "/" + prefix;
        }

        const std::string &Require(const std::map<std::string, std::string> &section,
                                   const char *section_name, const char *key,
                                   const std::string &origin)
        {
            auto it = section.find(Lower(key));
            if (it == section.end() || it->second.empty())
            {
                throw ConfigInvalid(origin + ": [" + section_name + "] is missing " + key);
            }
            return it->second;
        }

        // Keys that may repeat; wg-quick concatenates them.
        bool IsListKey(const std::string &lower_key)
        {
            return lower_key == "address" || lower_key == "dns" || lower_key == "allowedips";
        }
    } // namespace

    std::vector<std::string> SplitList(std::string_view value)
    {
        std::vector<std::string> out;
        std::size_t start = 0;
        while (start <= value.size())
        {
            const std::size_t pos = value.find(',', start);
            std::string_view tok = (pos == std::string_view::npos)
                                 ? value.substr(start)
                                 : value.substr(start, pos - start);
            tok = Trim(tok);
            if (!tok.empty()) out.emplace_back(tok);
            if (pos == std::string_view::npos) break;
            start = pos + 1;
        }
        return out;
    }

    std::pair<std::string, std::uint16_t> SplitEndpoint(const std::string &endpoint)
    {
        std::string host;
        std::string port;

        if (!endpoint.empty() && endpoint.front() == '[')
        {
            const std::size_t close = endpoint.find(']');
            if (close == std::string::npos || close + 1 >= endpoint.size() || endpoint[close + 1] != ':')
            {
                throw ConfigInvalid("invalid endpoint '" + endpoint + "'");
            }
            host = endpoint.substr(1, close - 1);
            port = endpoint.substr(close + 2);
        }
        else
        {
            const std::size_t colon = endpoint.rfind(':');
            if (colon == std::string::npos || endpoint.find(':') != colon)
            {
                throw ConfigInvalid("endpoint must be host:port, got '" + endpoint + "'");
            }
            host = endpoint.substr(0, colon);
            port = endpoint.substr(colon + 1);
        }

        if (host.empty() || port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); }))
        {
            throw ConfigInvalid("invalid endpoint '" + endpoint + "'");
        }
        const int p = std::stoi(port);
        if (p <= 0 || p > 65535)
        {
            throw ConfigInvalid("endpoint port out of range in '" + endpoint + "'");
        }
        return { host, static_cast<std::uint16_t>(p) };
    }

    TunnelDefinition ParseTunnelDefinition(std::string_view text, const std::string &origin)
    {
        TunnelDefinition def;

        bool have_interface = false;
        bool have_peer      = false;
        bool peer_done      = false;   // first [Peer] closed
        std::map<std::string, std::string> *current = nullptr;

        std::size_t lineno = 0;
        std::size_t pos    = 0;
        while (pos <= text.size())
        {
            std::size_t eol = text.find_first_of("\r\n", pos);
            if (eol == std::string_view::npos) eol = text.size();
            std::string_view line = Trim(text.substr(pos, eol - pos));
            pos = eol + 1;
            ++lineno;

            if (line.empty() || line.front() == '#' || line.front() == ';')
            {
                if (eol == text.size()) break;
                continue;
            }

            if (line.front() == '[' && line.back() == ']')
            {
                const std::string section = Lower(Trim(line.substr(1, line.size() - 2)));
                if (section == "interface")
                {
                    have_interface = true;
                    current = &def.interface_section;
                }
                else if (section == "peer")
                {
                    if (have_peer)
                    {
                        peer_done = true;
                        LOGD("store") << origin << ": extra [Peer] at line " << lineno << " ignored";
                    }
                    have_peer = true;
                    current = peer_done ? nullptr : &def.peer_section;
                }
                else
                {
                    LOGD("store") << origin << ": unknown section [" << section << "] ignored";
                    current = nullptr;
                }
            }
            else if (auto delim = line.find('='); delim != std::string_view::npos)
            {
                std::string key = Lower(Trim(line.substr(0, delim)));
                std::string_view value = Trim(line.substr(delim + 1));
                if (key.empty())
                {
                    throw ConfigInvalid(origin + ": invalid line (" + std::to_string(lineno) + "): '" +
                                        std::string(line) + "'");
                }
                if (current)
                {
                    auto [it, inserted] = current->emplace(key, std::string(value));
                    if (!inserted && IsListKey(key))
                    {
                        it->second += "," + std::string(value);
                    }
                }
            }
            else
            {
                throw ConfigInvalid(origin + ": invalid line (" + std::to_string(lineno) + "): '" +
                                    std::string(line) + "'");
            }

            if (eol == text.size()) break;
        }

        if (!have_interface)
        {
            throw ConfigInvalid(origin + ": missing [Interface] section");
        }
        if (!have_peer)
        {
            throw ConfigInvalid(origin + ": missing [Peer] section");
        }

        def.private_key     = Require(def.interface_section, "Interface", "PrivateKey", origin);
        def.peer_public_key = Require(def.peer_section, "Peer", "PublicKey", origin);
        def.endpoint        = Require(def.peer_section, "Peer", "Endpoint", origin);

        const auto addresses = SplitList(Require(def.interface_section, "Interface", "Address", origin));
        if (addresses.empty())
        {
            throw ConfigInvalid(origin + ": [Interface] Address is empty");
        }
        def.local_address = NormalizeCidr(addresses.front(), origin);
        if (addresses.size() > 1)
        {
            LOGD("store") << origin << ": using first Address " << def.local_address
                          << " of " << addresses.size();
        }

        if (auto it = def.interface_section.find("dns"); it != def.interface_section.end())
        {
            for (const std::string &dns : SplitList(it->second))
            {
                if (IsIpLiteral(dns))
                {
                    def.dns_servers.push_back(dns);
                }
                else
                {
                    // search domains share the DNS= key in wg-quick
                    LOGD("store") << origin << ": DNS entry '" << dns << "' is not an address, skipped";
                }
            }
        }

        auto allowed = def.peer_section.find("allowedips");
        const std::string allowed_raw = (allowed != def.peer_section.end()) ? allowed->second : "0.0.0.0/0";
        for (const std::string &cidr : SplitList(allowed_raw))
        {
            def.allowed_ips.push_back(NormalizeCidr(cidr, origin));
        }

        try
        {
            auto [host, port] = SplitEndpoint(def.endpoint);
            def.endpoint_host = host;
            def.endpoint_port = port;
        }
        catch (const ConfigInvalid &e)
        {
            throw ConfigInvalid(origin + ": " + e.what());
        }

        return def;
    }

    TunnelDefinition LoadTunnelDefinition(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            throw ConfigInvalid("cannot read tunnel definition " + path);
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        return ParseTunnelDefinition(buf.str(), path);
    }
} // namespace SafeRoute
