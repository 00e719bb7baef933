#pragma once

#include <utility>

namespace codejudge {

/**
 * @brief 将容器 b 的所有元素追加到容器 a 的末尾
 */
template <typename ContainerT>
void append(ContainerT &a, const ContainerT &b) {
    a.insert(a.end(), b.begin(), b.end());
}

}  // namespace codejudge
