#include "image_filter.hpp"

#include <glog/logging.h>

namespace {
  Try<std::vector<observer::GlobPattern>> compile_all(
      const std::string& desc, const std::vector<std::string>& patterns) {
    std::vector<observer::GlobPattern> compiled;
    for (const std::string& pattern : patterns) {
      Try<observer::GlobPattern> glob = observer::GlobPattern::compile(pattern);
      if (glob.isError()) {
        return Error("Invalid " + desc + " pattern: " + glob.error());
      }
      compiled.push_back(glob.get());
    }
    return compiled;
  }
}

Try<observer::ImageFilter> observer::ImageFilter::create(
    const std::vector<std::string>& excluded_images,
    const std::vector<std::string>& included_images,
    const std::vector<std::string>& excluded_labels) {
  Try<std::vector<GlobPattern>> excluded = compile_all("excluded image", excluded_images);
  if (excluded.isError()) {
    return Error(excluded.error());
  }
  Try<std::vector<GlobPattern>> included = compile_all("included image", included_images);
  if (included.isError()) {
    return Error(included.error());
  }

  std::vector<LabelRule> label_rules;
  for (const std::string& rule : excluded_labels) {
    size_t eq = rule.find('=');
    if (eq == std::string::npos || eq == 0) {
      return Error("Invalid excluded label rule[" + rule + "]: must be of the form key=glob");
    }
    Try<GlobPattern> glob = GlobPattern::compile(rule.substr(eq + 1));
    if (glob.isError()) {
      return Error("Invalid excluded label rule[" + rule + "]: " + glob.error());
    }
    label_rules.push_back(LabelRule(rule.substr(0, eq), glob.get()));
  }

  return ImageFilter(excluded.get(), included.get(), label_rules);
}

bool observer::ImageFilter::include(const Container& container) const {
  for (const GlobPattern& pattern : excluded_images) {
    if (pattern.matches(container.image)) {
      DLOG(INFO) << "Container[" << container.id << "] image[" << container.image << "] "
                 << "matches exclusion[" << pattern.string() << "]";
      return false;
    }
  }

  for (const LabelRule& rule : excluded_labels) {
    auto iter = container.labels.find(rule.key);
    if (iter != container.labels.end() && rule.value.matches(iter->second)) {
      DLOG(INFO) << "Container[" << container.id << "] label[" << rule.key << "=" << iter->second
                 << "] matches exclusion[" << rule.value.string() << "]";
      return false;
    }
  }

  if (included_images.empty()) {
    return true;
  }
  for (const GlobPattern& pattern : included_images) {
    if (pattern.matches(container.image)) {
      return true;
    }
  }
  DLOG(INFO) << "Container[" << container.id << "] image[" << container.image << "] "
             << "doesn't match any inclusions";
  return false;
}
