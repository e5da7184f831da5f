#pragma once

// Standard library headers
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <map>
#include <set>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <mutex>
#include <functional>
#include <algorithm>
#include <utility>
#include <optional>
#include <stdexcept>
#include <exception>
#include <deque>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <cstdint>
#include <cstring>
