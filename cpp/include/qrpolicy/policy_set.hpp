// ==============================================================================
// qrpolicy/policy_set.hpp - Полный набор политик из хранилища
// ==============================================================================
//
// Назначение:
// - Загрузка всех основных файлов и include/ фрагментов из PolicyStore
// - Контекст вычисления (таблица включений) для evaluate()
//
// Ошибки чтения отдельных файлов не прерывают загрузку: файл пропускается,
// ошибка возвращается в errors.
//
// ==============================================================================

#ifndef QRPOLICY_POLICY_SET_HPP
#define QRPOLICY_POLICY_SET_HPP

#include "qrpolicy/evaluator.hpp"
#include "qrpolicy/policy_file.hpp"
#include "qrpolicy/store.hpp"

#include <vector>

namespace qrpolicy {

struct PolicySet {
    std::vector<PolicyFile> files;     // основные файлы, по имени
    std::vector<PolicyFile> includes;  // include/ фрагменты
    std::vector<StoreError> errors;

    /// Контекст вычисления; указатели действительны, пока жив PolicySet
    EvaluationContext context(const QubeInfo* qubes = nullptr) const;
};

/// Загрузить все файлы хранилища
PolicySet load_policy_set(const PolicyStore& store);

/// Загрузить один файл (includes_allowed определяется по имени)
FetchResult load_policy_file(const PolicyStore& store, std::string_view name, PolicyFile& out);

}  // namespace qrpolicy

#endif  // QRPOLICY_POLICY_SET_HPP
