#pragma once
/**
 * @file document_registry.hpp
 * @brief Bookkeeping of documents the session has seen, keyed by normalized path.
 *
 * Pure data: the registry performs no host calls. `HostSession` decides what goes in and what
 * comes out (and holds the access lock while doing so). Keys are the normalized absolute path
 * lower-cased, so "C:\\Data\\Book.xlsx" and "c:/data/./book.xlsx" land on the same entry.
 *
 * Entries hold document handles as weak references in the sense that the registry never keeps
 * a document open on its own: the host owns the document, the registry only remembers it.
 */

#include "host/host_handle.hpp"
#include "hostkeeper_host_export.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::host
{

struct DocumentEntry
{
    std::string path;       ///< Normalized absolute path (original case).
    DocumentHandle handle;
    bool owned = false;     ///< true: this session opened it and must close it.
    size_t leases = 0;      ///< Outstanding leases; release acts only on the last one.
};

class HOSTKEEPER_HOST_EXPORT DocumentRegistry
{
  public:
    /**
     * @brief Absolute, lexically normal form of @p path with symlinks resolved where the path
     *        exists. Never touches the host.
     */
    static std::string normalize_path(std::string_view path);

    /// @brief Registry key for @p path: normalized, then ASCII lower-cased.
    static std::string make_key(std::string_view path);

    /**
     * @brief Inserts or replaces the entry for @p entry.path.
     * @return The stored entry (path normalized).
     */
    const DocumentEntry &insert(DocumentEntry entry);

    [[nodiscard]] std::optional<DocumentEntry> find(std::string_view path) const;

    /// @brief Removes and returns the entry, if present.
    std::optional<DocumentEntry> take(std::string_view path);

    /// @brief Adds one lease to the entry for @p path. Returns the new count, 0 when absent.
    size_t retain(std::string_view path);

    /**
     * @brief Drops one lease from the entry for @p path, never below zero.
     * @return Leases still outstanding afterwards.
     */
    size_t drop_lease(std::string_view path);

    /// @brief Removes the entry. Returns whether one was present.
    bool erase(std::string_view path);

    [[nodiscard]] bool contains(std::string_view path) const;

    /// @brief Ownership flag; false for unknown paths.
    [[nodiscard]] bool is_owned(std::string_view path) const;

    [[nodiscard]] std::vector<DocumentEntry> entries() const;
    [[nodiscard]] std::vector<std::string> paths() const;

    /// @brief Removes and returns every entry.
    std::vector<DocumentEntry> drain();

    void clear() noexcept { m_entries.clear(); }
    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

  private:
    std::map<std::string, DocumentEntry> m_entries;
};

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
