// ==============================================================================
// policy_set.cpp - Полный набор политик из хранилища
// ==============================================================================

#include "qrpolicy/policy_set.hpp"

#include <string>
#include <utility>

namespace qrpolicy {

FetchResult load_policy_file(const PolicyStore& store, std::string_view name, PolicyFile& out) {
    auto fetched = store.get(name);
    if (fetched) {
        out = PolicyFile::from_text(std::string(name), fetched.content, !is_include_name(name));
    }
    return fetched;
}

PolicySet load_policy_set(const PolicyStore& store) {
    PolicySet set;
    for (const auto& name : store.list()) {
        PolicyFile file(name);
        auto fetched = load_policy_file(store, name, file);
        if (!fetched) {
            set.errors.push_back(std::move(fetched.error));
            continue;
        }
        if (is_include_name(name)) {
            set.includes.push_back(std::move(file));
        } else {
            set.files.push_back(std::move(file));
        }
    }
    sort_by_name(set.files);
    return set;
}

EvaluationContext PolicySet::context(const QubeInfo* qubes) const {
    EvaluationContext ctx;
    ctx.qubes = qubes;
    for (const auto& f : includes) {
        ctx.includes.emplace(f.name(), &f);
    }
    // Основные файлы тоже могут быть включены по имени
    for (const auto& f : files) {
        ctx.includes.emplace(f.name(), &f);
    }
    return ctx;
}

}  // namespace qrpolicy
