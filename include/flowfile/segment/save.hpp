#pragma once

#include "flowfile/core/config.hpp"
#include "flowfile/core/file.hpp"
#include "flowfile/core/result.hpp"

#include <filesystem>

namespace flowfile::segment {

/**
 * @brief Lay @p file down under @p base_dir according to its attributes
 *
 * path/filename select the location (paths escaping @p base_dir are
 * rejected), kind selects file, dir or link. Whole files are written then
 * verified. Fragments are written at fragment.offset into a target that the
 * first arriving sibling pre-creates at segment.original.size; a target that
 * does not reach that size within the reassembly budget is a
 * ReassemblyTimeout. file.lastModifiedTime is applied to files and dirs.
 *
 * Returns the path written.
 */
Result<std::filesystem::path> save(File& file, const std::filesystem::path& base_dir,
                                   const SaveOptions& options = {});

} // namespace flowfile::segment
