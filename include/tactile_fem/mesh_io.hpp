#pragma once

#include "errors.hpp"
#include "mesh.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/std.h>

#include <safe_io/utils.hpp>

namespace tactile::fem
{
    // Where a contact object's geometry lives and how it is placed on the pad.
    // `id` is the stable identity used in cache keys.
    struct ObjectDescriptor
    {
        std::string id{};
        std::filesystem::path path{};
        double scale{1.0};
        double offset_x{0.0};
        double offset_y{0.0};
    };

    namespace detail
    {
        struct RawMesh
        {
            ElementKind kind{ElementKind::Triangle};
            std::vector<Node> nodes{};
            std::vector<Element> elements{};
        };

        inline std::string lowercase_extension(const std::filesystem::path& path)
        {
            auto extension = path.extension().string();
            std::transform(extension.begin(), extension.end(), extension.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return extension;
        }

        inline std::vector<char> read_file(const std::filesystem::path& path)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                throw AssetError(fmt::format("Mesh file not found: {}", path));
            }

            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                throw AssetError(fmt::format("Failed to open mesh file: {}", path));
            }
            std::vector<char> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            if (file.bad())
            {
                throw AssetError(fmt::format("Failed to read mesh file: {}", path));
            }
            return bytes;
        }

        // Merges vertices that fall into the same tolerance-sized cell.
        // Grid cell of edge `tolerance` holding `node`; points within `tolerance`
        // of each other always lie in neighbouring cells.
        inline std::array<long long, 3> tolerance_cell(const Node& node, double tolerance)
        {
            return {static_cast<long long>(std::floor(node.x / tolerance)),
                    static_cast<long long>(std::floor(node.y / tolerance)),
                    static_cast<long long>(std::floor(node.z / tolerance))};
        }

        // Calls `visit(j)` for the ids stored in the 27 cells around `key` until it returns true.
        template <typename Visit>
        bool visit_neighbour_cells(const std::map<std::array<long long, 3>, std::vector<std::size_t>>& cells,
                                   const std::array<long long, 3>& key, Visit&& visit)
        {
            for (long long dx = -1; dx <= 1; ++dx)
            {
                for (long long dy = -1; dy <= 1; ++dy)
                {
                    for (long long dz = -1; dz <= 1; ++dz)
                    {
                        const auto found = cells.find({key[0] + dx, key[1] + dy, key[2] + dz});
                        if (found == cells.end())
                        {
                            continue;
                        }
                        for (const auto j : found->second)
                        {
                            if (visit(j))
                            {
                                return true;
                            }
                        }
                    }
                }
            }
            return false;
        }

        // Merges facet corners lying within `tolerance` of an earlier corner.
        class VertexWelder
        {
        public:
            explicit VertexWelder(double tolerance)
                : m_tolerance(tolerance)
            {
            }

            std::size_t insert(const Node& node)
            {
                const auto key = tolerance_cell(node, m_tolerance);
                std::size_t match = 0;
                const bool merged = visit_neighbour_cells(m_cells, key, [&](std::size_t j) {
                    match = j;
                    return length(node - m_nodes[j]) <= m_tolerance;
                });
                if (merged)
                {
                    return match;
                }

                m_cells[key].push_back(m_nodes.size());
                m_nodes.push_back(node);
                return m_nodes.size() - 1;
            }

            [[nodiscard]] std::vector<Node> take_nodes() { return std::move(m_nodes); }

        private:
            double m_tolerance{1e-6};
            std::map<std::array<long long, 3>, std::vector<std::size_t>> m_cells{};
            std::vector<Node> m_nodes{};
        };

        inline Node read_stl_vertex(const char* data)
        {
            std::array<float, 3> xyz{};
            // Binary STL is little-endian float32.
            std::memcpy(xyz.data(), data, sizeof(xyz));
            return Node{static_cast<double>(xyz[0]), static_cast<double>(xyz[1]), static_cast<double>(xyz[2])};
        }

        inline RawMesh read_stl(const std::filesystem::path& path, double scale, double tolerance)
        {
            const auto bytes = read_file(path);

            std::vector<Node> corners;
            bool binary = false;
            if (bytes.size() >= 84)
            {
                std::uint32_t facet_count = 0;
                std::memcpy(&facet_count, bytes.data() + 80, sizeof(facet_count));
                binary = bytes.size() == 84 + 50 * static_cast<std::size_t>(facet_count);
                if (binary)
                {
                    corners.reserve(3 * static_cast<std::size_t>(facet_count));
                    for (std::size_t f = 0; f < facet_count; ++f)
                    {
                        // 12 bytes normal, 3 x 12 bytes corners, 2 bytes attribute.
                        const char* facet = bytes.data() + 84 + 50 * f;
                        for (std::size_t c = 0; c < 3; ++c)
                        {
                            corners.push_back(read_stl_vertex(facet + 12 + 12 * c));
                        }
                    }
                }
            }

            if (!binary)
            {
                const std::string text(bytes.begin(), bytes.end());
                std::istringstream stream(text);
                std::string token;
                if (!(stream >> token) || token != "solid")
                {
                    throw AssetError(fmt::format("{} is neither ASCII STL nor a complete binary STL", path));
                }

                std::size_t facets = 0;
                while (stream >> token)
                {
                    if (token == "facet")
                    {
                        ++facets;
                    }
                    else if (token == "vertex")
                    {
                        Node corner{};
                        if (!(stream >> corner.x >> corner.y >> corner.z))
                        {
                            throw AssetError(fmt::format("Malformed vertex in {}", path));
                        }
                        corners.push_back(corner);
                    }
                }
                if (corners.size() != 3 * facets)
                {
                    throw AssetError(fmt::format("{} has {} facets but {} vertices", path, facets, corners.size()));
                }
            }

            if (corners.empty())
            {
                throw AssetError(fmt::format("{} contains no facets", path));
            }

            VertexWelder welder(tolerance);
            RawMesh raw{};
            raw.kind = ElementKind::Triangle;
            raw.elements.reserve(corners.size() / 3);
            for (std::size_t f = 0; f < corners.size() / 3; ++f)
            {
                Element element{};
                for (std::size_t c = 0; c < 3; ++c)
                {
                    const auto& corner = corners[3 * f + c];
                    if (!std::isfinite(corner.x) || !std::isfinite(corner.y) || !std::isfinite(corner.z))
                    {
                        throw AssetError(fmt::format("Facet {} of {} has a non-finite vertex", f, path));
                    }
                    element.node_ids[c] = welder.insert(corner * scale);
                }
                raw.elements.push_back(element);
            }
            raw.nodes = welder.take_nodes();

            safe_io::debug("Loaded {} STL {}: {} facets, {} welded vertices",
                           binary ? "binary" : "ASCII", path, raw.elements.size(), raw.nodes.size());
            return raw;
        }

        // Medit .mesh: MeshVersionFormatted / Dimension 3 header followed by
        // Vertices, Triangles and Tetrahedra blocks with 1-based indices.
        inline RawMesh read_medit(const std::filesystem::path& path, double scale)
        {
            const auto bytes = read_file(path);
            std::istringstream file(std::string(bytes.begin(), bytes.end()));

            std::string keyword;
            int value = 0;
            if (!(file >> keyword >> value) || keyword != "MeshVersionFormatted")
            {
                throw AssetError(fmt::format("{}: expected 'MeshVersionFormatted'", path));
            }
            if (!(file >> keyword >> value) || keyword != "Dimension")
            {
                throw AssetError(fmt::format("{}: expected 'Dimension'", path));
            }
            if (value != 3)
            {
                throw AssetError(fmt::format("{}: only 3D meshes are supported, got dimension {}", path, value));
            }

            std::vector<Node> vertices;
            std::vector<Element> triangles;
            std::vector<Element> tetrahedra;

            const auto read_count = [&](const std::string& block) {
                long long count = -1;
                if (!(file >> count) || count < 0)
                {
                    throw AssetError(fmt::format("{}: missing element count for '{}'", path, block));
                }
                return static_cast<std::size_t>(count);
            };

            const auto read_elements = [&](const std::string& block, std::size_t arity, std::vector<Element>& out) {
                const auto count = read_count(block);
                out.reserve(count);
                for (std::size_t i = 0; i < count; ++i)
                {
                    Element element{};
                    for (std::size_t c = 0; c < arity; ++c)
                    {
                        long long id = 0;
                        if (!(file >> id))
                        {
                            throw AssetError(fmt::format("{}: truncated '{}' block at entry {}", path, block, i));
                        }
                        if (id < 1)
                        {
                            throw AssetError(fmt::format("{}: '{}' entry {} has invalid vertex index {}", path, block, i, id));
                        }
                        element.node_ids[c] = static_cast<std::size_t>(id - 1);
                    }
                    long long reference = 0;
                    if (!(file >> reference))
                    {
                        throw AssetError(fmt::format("{}: truncated '{}' block at entry {}", path, block, i));
                    }
                    out.push_back(element);
                }
            };

            while (file >> keyword)
            {
                if (keyword == "End")
                {
                    break;
                }
                if (keyword == "Vertices")
                {
                    const auto count = read_count(keyword);
                    vertices.reserve(count);
                    for (std::size_t i = 0; i < count; ++i)
                    {
                        Node v{};
                        long long reference = 0;
                        if (!(file >> v.x >> v.y >> v.z >> reference))
                        {
                            throw AssetError(fmt::format("{}: truncated 'Vertices' block at entry {}", path, i));
                        }
                        if (!std::isfinite(v.x) || !std::isfinite(v.y) || !std::isfinite(v.z))
                        {
                            throw AssetError(fmt::format("{}: vertex {} is not finite", path, i + 1));
                        }
                        vertices.push_back(v * scale);
                    }
                }
                else if (keyword == "Triangles")
                {
                    read_elements(keyword, 3, triangles);
                }
                else if (keyword == "Tetrahedra")
                {
                    read_elements(keyword, 4, tetrahedra);
                }
                else
                {
                    throw AssetError(fmt::format("{}: unsupported block '{}'", path, keyword));
                }
            }

            RawMesh raw{};
            raw.nodes = std::move(vertices);
            if (!tetrahedra.empty())
            {
                raw.kind = ElementKind::Tetrahedron;
                raw.elements = std::move(tetrahedra);
            }
            else
            {
                raw.kind = ElementKind::Triangle;
                raw.elements = std::move(triangles);
            }

            safe_io::debug("Loaded Medit mesh {}: {} vertices, {} {} elements",
                           path, raw.nodes.size(), raw.elements.size(), to_string(raw.kind));
            return raw;
        }

        // First pair of distinct nodes closer than `tolerance`, if any.
        inline std::optional<std::pair<std::size_t, std::size_t>> find_coincident_nodes(const std::vector<Node>& nodes, double tolerance)
        {
            std::map<std::array<long long, 3>, std::vector<std::size_t>> cells;
            for (std::size_t i = 0; i < nodes.size(); ++i)
            {
                const auto key = tolerance_cell(nodes[i], tolerance);
                std::size_t match = 0;
                const bool coincident = visit_neighbour_cells(cells, key, [&](std::size_t j) {
                    match = j;
                    return length(nodes[i] - nodes[j]) <= tolerance;
                });
                if (coincident)
                {
                    return std::make_pair(match, i);
                }
                cells[key].push_back(i);
            }
            return std::nullopt;
        }

        inline void check_raw_mesh(const RawMesh& raw, const std::filesystem::path& path, double tolerance)
        {
            if (raw.elements.empty())
            {
                throw AssetError(fmt::format("{} contains no elements", path));
            }

            const auto arity = nodes_per_element(raw.kind);
            std::vector<bool> referenced(raw.nodes.size(), false);
            for (std::size_t e = 0; e < raw.elements.size(); ++e)
            {
                const auto& ids = raw.elements[e].node_ids;
                for (std::size_t a = 0; a < arity; ++a)
                {
                    if (ids[a] >= raw.nodes.size())
                    {
                        throw AssetError(fmt::format("{}: element {} references missing vertex {}", path, e, ids[a] + 1));
                    }
                    for (std::size_t b = 0; b < a; ++b)
                    {
                        if (ids[a] == ids[b])
                        {
                            throw AssetError(fmt::format("{}: element {} repeats vertex {}", path, e, ids[a] + 1));
                        }
                    }
                    referenced[ids[a]] = true;
                }

                const auto& a = raw.nodes[ids[0]];
                const auto& b = raw.nodes[ids[1]];
                const auto& c = raw.nodes[ids[2]];
                const double edge = std::max({length(b - a), length(c - a), length(c - b)});
                if (raw.kind == ElementKind::Triangle)
                {
                    if (!(triangle_area(a, b, c) > 1e-10 * edge * edge))
                    {
                        throw AssetError(fmt::format("{}: triangle {} has zero area", path, e));
                    }
                }
                else
                {
                    const auto& d = raw.nodes[ids[3]];
                    const double longest = std::max({edge, length(d - a), length(d - b), length(d - c)});
                    if (!(std::abs(tetrahedron_volume(a, b, c, d)) > 1e-10 * longest * longest * longest))
                    {
                        throw AssetError(fmt::format("{}: tetrahedron {} has zero volume", path, e));
                    }
                }
            }

            if (raw.kind == ElementKind::Tetrahedron)
            {
                const auto unused = std::find(referenced.begin(), referenced.end(), false);
                if (unused != referenced.end())
                {
                    throw AssetError(fmt::format("{}: vertex {} is not used by any tetrahedron", path, (unused - referenced.begin()) + 1));
                }
            }

            if (const auto pair = find_coincident_nodes(raw.nodes, tolerance))
            {
                throw AssetError(fmt::format("{}: vertices {} and {} coincide within {}", path, pair->first + 1, pair->second + 1, tolerance));
            }
        }
    } // namespace detail

    // Loads an STL or Medit mesh, chosen by extension, scaled by `scale`.
    // Every malformed input surfaces as AssetError.
    inline Mesh load_mesh(const std::filesystem::path& path, double scale = 1.0, double tolerance = 1e-6)
    {
        if (!std::isfinite(scale) || scale <= 0.0)
        {
            throw std::invalid_argument(fmt::format("Mesh scale must be positive, got {}", scale));
        }
        if (!std::isfinite(tolerance) || tolerance <= 0.0)
        {
            throw std::invalid_argument(fmt::format("Mesh tolerance must be positive, got {}", tolerance));
        }

        const auto extension = detail::lowercase_extension(path);
        detail::RawMesh raw{};
        if (extension == ".stl")
        {
            raw = detail::read_stl(path, scale, tolerance);
        }
        else if (extension == ".mesh")
        {
            raw = detail::read_medit(path, scale);
        }
        else
        {
            throw AssetError(fmt::format("Unsupported mesh format '{}' for {}", extension, path));
        }

        detail::check_raw_mesh(raw, path, tolerance);

        try
        {
            return Mesh(raw.kind, std::move(raw.nodes), std::move(raw.elements));
        }
        catch (const MeshError& e)
        {
            throw AssetError(fmt::format("{}: {}", path, e.what()));
        }
    }

    inline Mesh load(const ObjectDescriptor& descriptor, double tolerance = 1e-6)
    {
        return load_mesh(descriptor.path, descriptor.scale, tolerance);
    }
} // namespace tactile::fem
