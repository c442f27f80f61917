#ifndef SPECFLOW_SPEC_STORE_HPP
#define SPECFLOW_SPEC_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "spec.hpp"

namespace specflow {
namespace fs = std::filesystem;

/**
 * @brief Directory of `<id>.md` spec files.
 *
 * The store holds no cached state; every call reads or writes the disk so that
 * concurrent workers always observe the latest statuses.
 */
class SpecStore {
  public:
    explicit SpecStore(fs::path dir) : dir_(std::move(dir)) {}

    const fs::path& dir() const { return dir_; }
    fs::path path_for(const std::string& id) const { return dir_ / (id + ".md"); }
    bool exists(const std::string& id) const;

    /**
     * @brief Load and parse one spec.
     *
     * @param id    Spec identifier.
     * @param error Optional output receiving an I/O or parse error.
     */
    std::optional<Spec> load(const std::string& id, std::string* error = nullptr) const;

    /**
     * @brief Load every spec in the directory, sorted by id.
     *
     * Files that fail to parse are skipped and described in @p errors.
     */
    std::vector<Spec> load_all(std::vector<std::string>* errors = nullptr) const;

    /**
     * @brief Write a spec atomically (temporary file, then rename).
     *
     * @return `false` with @p error set when the file could not be written.
     */
    bool save(const Spec& spec, std::string& error) const;

    /**
     * @brief Resolve a full id or a unique fragment of one to a spec id.
     *
     * An exact match wins. Otherwise the first non-empty tier of prefix,
     * suffix and substring matches is used and must hold exactly one id.
     */
    std::optional<std::string> resolve_id(const std::string& partial,
                                          std::string* error = nullptr) const;

  private:
    std::vector<std::string> list_ids() const;

    fs::path dir_;
};

} // namespace specflow

#endif // SPECFLOW_SPEC_STORE_HPP
