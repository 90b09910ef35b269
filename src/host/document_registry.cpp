#include "host/document_registry.hpp"
#include "hk_base.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace hostkeeper::host
{

std::string DocumentRegistry::normalize_path(std::string_view path)
{
    if (path.empty())
        return {};

    std::error_code ec;
    fs::path p = fs::absolute(fs::path(std::string(path)), ec);
    if (ec)
    {
        p = fs::path(std::string(path));
    }
    // weakly_canonical resolves the existing prefix and keeps the rest lexical.
    fs::path canonical = fs::weakly_canonical(p, ec);
    if (ec)
    {
        canonical = p.lexically_normal();
    }
    return canonical.make_preferred().string();
}

std::string DocumentRegistry::make_key(std::string_view path)
{
    return format_tools::to_lower_ascii(normalize_path(path));
}

const DocumentEntry &DocumentRegistry::insert(DocumentEntry entry)
{
    entry.path = normalize_path(entry.path);
    auto key = format_tools::to_lower_ascii(entry.path);
    auto &slot = m_entries[std::move(key)];
    slot = std::move(entry);
    return slot;
}

std::optional<DocumentEntry> DocumentRegistry::find(std::string_view path) const
{
    auto it = m_entries.find(make_key(path));
    if (it == m_entries.end())
        return std::nullopt;
    return it->second;
}

std::optional<DocumentEntry> DocumentRegistry::take(std::string_view path)
{
    auto it = m_entries.find(make_key(path));
    if (it == m_entries.end())
        return std::nullopt;
    DocumentEntry entry = std::move(it->second);
    m_entries.erase(it);
    return entry;
}

size_t DocumentRegistry::retain(std::string_view path)
{
    auto it = m_entries.find(make_key(path));
    if (it == m_entries.end())
        return 0;
    return ++it->second.leases;
}

size_t DocumentRegistry::drop_lease(std::string_view path)
{
    auto it = m_entries.find(make_key(path));
    if (it == m_entries.end())
        return 0;
    if (it->second.leases > 0)
        --it->second.leases;
    return it->second.leases;
}

bool DocumentRegistry::erase(std::string_view path)
{
    return m_entries.erase(make_key(path)) > 0;
}

bool DocumentRegistry::contains(std::string_view path) const
{
    return m_entries.count(make_key(path)) > 0;
}

bool DocumentRegistry::is_owned(std::string_view path) const
{
    auto it = m_entries.find(make_key(path));
    return it != m_entries.end() && it->second.owned;
}

std::vector<DocumentEntry> DocumentRegistry::entries() const
{
    std::vector<DocumentEntry> out;
    out.reserve(m_entries.size());
    for (const auto &[key, entry] : m_entries)
        out.push_back(entry);
    return out;
}

std::vector<std::string> DocumentRegistry::paths() const
{
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (const auto &[key, entry] : m_entries)
        out.push_back(entry.path);
    return out;
}

std::vector<DocumentEntry> DocumentRegistry::drain()
{
    std::vector<DocumentEntry> out;
    out.reserve(m_entries.size());
    for (auto &[key, entry] : m_entries)
        out.push_back(std::move(entry));
    m_entries.clear();
    return out;
}

} // namespace hostkeeper::host
