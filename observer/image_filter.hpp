#pragma once

#include <string>
#include <vector>

#include <stout/try.hpp>

#include "container.hpp"
#include "glob_pattern.hpp"

namespace observer {

  /**
   * Decides which containers are eligible for endpoint discovery, based on their image reference
   * and labels. All patterns are compiled once by create(), so that a malformed pattern is
   * reported at startup rather than on every cycle.
   */
  class ImageFilter {
   public:
    /**
     * Compiles the provided image globs and 'key=glob' label rules, or returns an error naming
     * the first malformed entry.
     */
    static Try<ImageFilter> create(
        const std::vector<std::string>& excluded_images,
        const std::vector<std::string>& included_images,
        const std::vector<std::string>& excluded_labels);

    /**
     * Returns whether the container passes the filter:
     * - excluded if its image matches any excluded image pattern
     * - excluded if any of its labels matches an excluded label rule
     * - otherwise, included if no included image patterns are configured, or if its image
     *   matches at least one of them
     */
    bool include(const Container& container) const;

   private:
    class LabelRule {
     public:
      LabelRule(const std::string& key, const GlobPattern& value)
        : key(key), value(value) { }

      std::string key;
      GlobPattern value;
    };

    ImageFilter(
        const std::vector<GlobPattern>& excluded_images,
        const std::vector<GlobPattern>& included_images,
        const std::vector<LabelRule>& excluded_labels)
      : excluded_images(excluded_images),
        included_images(included_images),
        excluded_labels(excluded_labels) { }

    std::vector<GlobPattern> excluded_images;
    std::vector<GlobPattern> included_images;
    std::vector<LabelRule> excluded_labels;
  };

}
