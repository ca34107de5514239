#ifndef SPARKBRIDGE_PTR_CAST_HPP
#define SPARKBRIDGE_PTR_CAST_HPP

#include <memory>

/// Moves ownership into a `unique_ptr<Derived>` when the dynamic type
/// matches. On mismatch `p` keeps ownership and an empty pointer is returned.
template <typename Derived, typename Base>
std::unique_ptr<Derived> dynamic_unique_ptr_cast(std::unique_ptr<Base>&& p) {
    if (auto* result = dynamic_cast<Derived*>(p.get())) {
        p.release();
        return std::unique_ptr<Derived>{result};
    }
    return {};
}

#endif //SPARKBRIDGE_PTR_CAST_HPP
