#pragma once

// Standard library headers
#include <iostream>
#include <string>
#include <vector>
#include <array>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <map>
#include <set>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <mutex>
#include <functional>
#include <algorithm>
#include <utility>
#include <stdexcept>
#include <optional>
#include <variant>
#include <cstdint>
#include <cstring>
#include <cmath>
#include <filesystem>

// Third-party headers (stable, never change)
#include <glm/glm.hpp>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
