#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: mesh.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн resources модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace shp
{
    // Indexed гурвалжны mesh. normals/tangents/bitangents нь хоосон эсвэл positions-тэй ижил урттай.
    struct MeshData
    {
        std::string label{};
        std::vector<glm::vec3> positions{};
        std::vector<glm::vec3> normals{};
        std::vector<glm::vec2> uvs{};
        std::vector<glm::vec3> tangents{};
        std::vector<glm::vec3> bitangents{};
        std::vector<uint32_t> indices{};

        bool empty() const
        {
            return positions.empty() || indices.empty();
        }

        size_t vertex_count() const { return positions.size(); }
        size_t triangle_count() const { return indices.size() / 3; }

        bool has_tangent_basis() const
        {
            return normals.size() == positions.size() &&
                tangents.size() == positions.size() &&
                bitangents.size() == positions.size();
        }

        void clear()
        {
            positions.clear();
            normals.clear();
            uvs.clear();
            tangents.clear();
            bitangents.clear();
            indices.clear();
        }
    };
}
