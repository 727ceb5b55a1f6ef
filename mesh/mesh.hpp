#ifndef MESH_HPP
#define MESH_HPP

#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../math/math.hpp"
#include "IndexFormat.hpp"
#include "GeometrySettings.hpp"
#include "GeometryBuffer.hpp"
#include "HostMesh.hpp"
#include "HostThreadToken.hpp"
#include "HeadlessHostMesh.hpp"
#include "HostMeshGateway.hpp"
#include "GeometryUploadQueue.hpp"

#endif // MESH_HPP
