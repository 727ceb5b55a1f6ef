#ifndef MATH_HPP
#define MATH_HPP

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "GeometryException.hpp"
#include "BoundingBox.hpp"
#include "Math.hpp"
#include "CloseVec3Hasher.hpp"

#endif // MATH_HPP
