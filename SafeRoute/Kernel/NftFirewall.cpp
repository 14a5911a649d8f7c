#include "SafeRoute/Kernel/NftFirewall.hpp"
#include "SafeRoute/Errors.hpp"
#include "SafeRoute/Logger.hpp"

#include <nftables/libnftables.h>

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

namespace SafeRoute
{
    namespace
    {
        namespace json = boost::json;

        struct NftCtxDeleter
        {
            void operator()(nft_ctx *ctx) const { nft_ctx_free(ctx); }
        };
        using NftCtx = std::unique_ptr<nft_ctx, NftCtxDeleter>;

        NftCtx MakeCtx(unsigned int output_flags = 0)
        {
            NftCtx ctx(nft_ctx_new(NFT_CTX_DEFAULT));
            if (!ctx)
            {
                throw KernelOperationError("libnftables: nft_ctx_new failed");
            }
            nft_ctx_buffer_output(ctx.get());
            nft_ctx_buffer_error(ctx.get());
            if (output_flags)
            {
                nft_ctx_output_set_flags(ctx.get(), output_flags);
            }
            return ctx;
        }

        std::string Lower(std::string s)
        {
            std::transform(s.begin(),
                           s.end(),
                           s.begin(),
                           [](unsigned char c)
                           {
                               return static_cast<char>(std::tolower(c));
                           });
            return s;
        }

        std::string ErrorText(nft_ctx *ctx)
        {
            const char *err = nft_ctx_get_error_buffer(ctx);
            return err ? std::string(err) : std::string();
        }

        bool IsMissingObject(const std::string &err)
        {
            return Lower(err).find("no such file or directory") != std::string::npos;
        }

        std::uint16_t PortOf(const json::value &v)
        {
            if (v.is_int64())  return static_cast<std::uint16_t>(v.as_int64());
            if (v.is_uint64()) return static_cast<std::uint16_t>(v.as_uint64());
            if (v.is_string())
            {
                try
                {
                    return static_cast<std::uint16_t>(std::stoi(std::string(v.as_string())));
                }
                catch (const std::exception &)
                {
                    return 0;
                }
            }
            return 0;
        }

        // one "match" expression: {"left": {...}, "right": ...}
        void ApplyMatch(const json::object &m, NatRule &r)
        {
            const json::value *left  = m.if_contains("left");
            const json::value *right = m.if_contains("right");
            if (!left || !right || !left->is_object()) return;

            if (const json::value *payload = left->as_object().if_contains("payload"))
            {
                if (!payload->is_object()) return;
                const json::object &po = payload->as_object();
                const json::value *proto = po.if_contains("protocol");
                const json::value *field = po.if_contains("field");
                if (!proto || !field || !proto->is_string() || !field->is_string()) return;

                const std::string p(proto->as_string());
                const std::string f(field->as_string());
                if ((p == "ip" || p == "ip6") && f == "saddr" && right->is_string())
                {
                    r.source = HostOf(std::string(right->as_string()));
                }
                else if ((p == "udp" || p == "tcp") && f == "dport")
                {
                    r.protocol = p;
                    r.dport    = PortOf(*right);
                }
                return;
            }

            if (const json::value *meta = left->as_object().if_contains("meta"))
            {
                if (meta->is_object() && right->is_string())
                {
                    const json::value *key = meta->as_object().if_contains("key");
                    if (key && key->is_string() && key->as_string() == "l4proto")
                    {
                        r.protocol = std::string(right->as_string());
                    }
                }
            }
        }
    } // namespace

    std::vector<NatRule> ParseDnatListing(const std::string &text)
    {
        json::value doc;
        try
        {
            doc = json::parse(text);
        }
        catch (const std::exception &e)
        {
            throw KernelOperationError(std::string("nft listing is not JSON: ") + e.what());
        }

        const json::object *root = doc.if_object();
        const json::value *items = root ? root->if_contains("nftables") : nullptr;
        if (!items || !items->is_array())
        {
            throw KernelOperationError("nft listing: missing \"nftables\" array");
        }

        std::vector<NatRule> out;
        std::size_t position = 0;

        for (const json::value &item : items->as_array())
        {
            const json::object *io = item.if_object();
            const json::value *rule = io ? io->if_contains("rule") : nullptr;
            if (!rule || !rule->is_object()) continue;

            ++position;
            const json::object &ro = rule->as_object();

            NatRule r;
            r.position = position;
            if (const json::value *h = ro.if_contains("handle"))
            {
                if (h->is_int64())  r.handle = static_cast<std::uint64_t>(h->as_int64());
                if (h->is_uint64()) r.handle = h->as_uint64();
            }
            if (const json::value *c = ro.if_contains("comment"); c && c->is_string())
            {
                r.comment = std::string(c->as_string());
            }

            bool is_dnat = false;
            const json::value *expr = ro.if_contains("expr");
            if (expr && expr->is_array())
            {
                for (const json::value &e : expr->as_array())
                {
                    const json::object *eo = e.if_object();
                    if (!eo) continue;

                    if (const json::value *m = eo->if_contains("match"); m && m->is_object())
                    {
                        ApplyMatch(m->as_object(), r);
                    }
                    else if (const json::value *d = eo->if_contains("dnat"); d && d->is_object())
                    {
                        is_dnat = true;
                        const json::object &dobj = d->as_object();
                        if (const json::value *a = dobj.if_contains("addr"); a && a->is_string())
                        {
                            r.to_address = std::string(a->as_string());
                        }
                        if (const json::value *p = dobj.if_contains("port"))
                        {
                            r.to_port = PortOf(*p);
                        }
                    }
                }
            }

            if (is_dnat)
            {
                out.push_back(std::move(r));
            }
        }
        return out;
    }

    std::string DnatRuleText(const NatRule &rule)
    {
        const bool v6 = rule.source.find(':') != std::string::npos;
        std::string to = rule.to_address;
        if (rule.to_port != 0)
        {
            to = (rule.to_address.find(':') != std::string::npos ? "[" + to + "]" : to)
               + ":" + std::to_string(rule.to_port);
        }

        std::string text = std::string(v6 ? "ip6" : "ip") + " saddr " + rule.source + " "
                         + rule.protocol + " dport " + std::to_string(rule.dport) + " "
                         + (v6 ? "dnat ip6 to " : "dnat ip to ") + to;
        if (!rule.comment.empty())
        {
            text += " comment \"" + rule.comment + "\"";
        }
        return text;
    }

    NftFirewall::NftFirewall() : NftFirewall(Params{})
    {
    }

    NftFirewall::NftFirewall(const Params &params) : p_(params)
    {
    }

    bool NftFirewall::Run_(const std::string &script)
    {
        LOGT("nft") << "run: " << script;
        NftCtx ctx = MakeCtx();

        const int rc = nft_run_cmd_from_buffer(ctx.get(), script.c_str());
        if (rc != 0)
        {
            LOGE("nft") << "rc=" << rc << " err=" << ErrorText(ctx.get());
            LOGE("nft") << "commands:\n" << script;
            return false;
        }
        LOGD("nft") << "ok";
        return true;
    }

    Outcome NftFirewall::EnsureDnatChain()
    {
        {
            NftCtx probe = MakeCtx();
            const std::string cmd = "list chain " + p_.dns_family + " " + p_.dns_table + " " + p_.dns_chain;
            if (nft_run_cmd_from_buffer(probe.get(), cmd.c_str()) == 0)
            {
                return Outcome::Unchanged("chain exists");
            }
        }

        std::string cmd;
        cmd  = "add table " + p_.dns_family + " " + p_.dns_table + "\n";
        cmd += "add chain " + p_.dns_family + " " + p_.dns_table + " " + p_.dns_chain
             + " { type nat hook prerouting priority " + std::to_string(p_.dnat_priority)
             + " ; policy accept; }\n";
        if (!Run_(cmd))
        {
            return Outcome::Failed("cannot create nat chain " + p_.dns_table + "/" + p_.dns_chain);
        }
        LOGI("nft") << "DNAT chain ready: " << p_.dns_family << " " << p_.dns_table << " " << p_.dns_chain;
        return Outcome::Applied();
    }

    std::vector<NatRule> NftFirewall::ListDnatRules()
    {
        NftCtx ctx = MakeCtx(NFT_CTX_OUTPUT_JSON | NFT_CTX_OUTPUT_HANDLE);
        const std::string cmd = "list chain " + p_.dns_family + " " + p_.dns_table + " " + p_.dns_chain;

        const int rc = nft_run_cmd_from_buffer(ctx.get(), cmd.c_str());
        if (rc != 0)
        {
            const std::string err = ErrorText(ctx.get());
            if (IsMissingObject(err))
            {
                LOGD("nft") << "list: chain absent, no rules";
                return {};
            }
            LOGE("nft") << "list failed rc=" << rc << " err=" << err;
            throw KernelOperationError("nft list chain failed: " + err);
        }

        const char *buf = nft_ctx_get_output_buffer(ctx.get());
        const std::string out = buf ? std::string(buf) : std::string();
        if (out.empty()) return {};

        auto rules = ParseDnatListing(out);
        LOGT("nft") << "list: " << rules.size() << " dnat rule(s)";
        return rules;
    }

    Outcome NftFirewall::InsertDnatRule(const NatRule &rule)
    {
        const std::string cmd = "insert rule " + p_.dns_family + " " + p_.dns_table + " " + p_.dns_chain + " "
                              + DnatRuleText(rule) + "\n";
        if (!Run_(cmd))
        {
            return Outcome::Failed("nft insert rule failed for " + rule.source);
        }
        return Outcome::Applied();
    }

    Outcome NftFirewall::DeleteDnatRule(const NatRule &rule)
    {
        if (rule.handle == 0)
        {
            return Outcome::Failed("rule handle unknown for position " + std::to_string(rule.position));
        }

        NftCtx ctx = MakeCtx();
        const std::string cmd = "delete rule " + p_.dns_family + " " + p_.dns_table + " " + p_.dns_chain
                              + " handle " + std::to_string(rule.handle) + "\n";
        const int rc = nft_run_cmd_from_buffer(ctx.get(), cmd.c_str());
        if (rc != 0)
        {
            const std::string err = ErrorText(ctx.get());
            if (IsMissingObject(err))
            {
                LOGD("nft") << "delete: handle " << rule.handle << " already gone";
                return Outcome::Unchanged("rule absent");
            }
            LOGE("nft") << "delete handle " << rule.handle << ": " << err;
            return Outcome::Failed("nft delete rule failed: " + err);
        }
        return Outcome::Applied();
    }

    Outcome NftFirewall::EnsureForwarding(const std::string &interface_prefix)
    {
        const std::string t   = "inet " + p_.nat_table;
        const std::string oif = "oifname \"" + interface_prefix + "*\"";
        const std::string iif = "iifname \"" + interface_prefix + "*\"";

        std::string cmd;
        cmd  = "add table " + t + "\n";
        cmd += "add chain " + t + " postrouting { type nat hook postrouting priority 100 ; policy accept; }\n";
        cmd += "add chain " + t + " mangle_post { type filter hook postrouting priority -150 ; policy accept; }\n";
        cmd += "add chain " + t + " forward { type filter hook forward priority 0 ; policy accept; }\n";
        cmd += "flush chain " + t + " postrouting\n";
        cmd += "flush chain " + t + " mangle_post\n";
        cmd += "flush chain " + t + " forward\n";
        cmd += "add rule " + t + " postrouting " + oif + " counter masquerade comment \"saferoute:auto\"\n";
        cmd += "add rule " + t + " forward " + iif + " accept\n";
        cmd += "add rule " + t + " forward " + oif + " accept\n";

        if (!Run_(cmd))
        {
            return Outcome::Failed("nft forwarding rules failed");
        }

        // MSS: сначала RT MTU, затем фиксированный фоллбэк для старых nft
        const std::string mss_rt = "add rule " + t + " mangle_post " + oif
                                 + " tcp flags syn tcp option maxseg size set rt mtu\n";
        if (!Run_(mss_rt))
        {
            const int mss = std::max(536, p_.tunnel_mtu - 40);
            LOGW("nft") << "RT MTU clamp rejected, fallback to fixed MSS " << mss;
            const std::string mss_fix = "add rule " + t + " mangle_post " + oif
                                      + " tcp flags syn tcp option maxseg size set "
                                      + std::to_string(mss) + "\n";
            if (!Run_(mss_fix))
            {
                return Outcome::Failed("nft MSS clamp rules failed");
            }
        }
        LOGI("nft") << "forwarding/masquerade ready for " << interface_prefix << "*";
        return Outcome::Applied();
    }
} // namespace SafeRoute
