#pragma once

#include <memory>
#include <utility>
#include <vector>

using namespace std;

template <typename T> using uptr = std::unique_ptr<T>;
template <typename T> using sptr = std::shared_ptr<T>;
