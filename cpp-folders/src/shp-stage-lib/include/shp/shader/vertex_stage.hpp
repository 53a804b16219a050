#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: vertex_stage.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн shader модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <glm/glm.hpp>

#include "shp/camera/camera_uniform.hpp"
#include "shp/math/linalg.hpp"
#include "shp/resources/mesh.hpp"
#include "shp/shader/types.hpp"

namespace shp
{
    // Камергүй минимал pass: clip = model * (p, 1). Гаралтын орон зайг model тодорхойлно.
    inline Varyings vertex_stage_position_only(const glm::vec3& local_pos, const glm::mat4& model)
    {
        Varyings o{};
        o.clip = transform_point(model, local_pos);
        return o;
    }

    // Full-attribute горим. Чиглэлтэй attribute-уудыг instance матрицаар үржүүлээд
    // дахин normalize хийнэ (inverse-transpose ашиглахгүй). Энэ нь зөвхөн
    // жигд scale-тэй instance-д яг зөв; жигд бус scale үед normal бага зэрэг хазайна.
    inline Varyings vertex_stage_full(const VertexAttributes& vin, const InstanceTransform& instance, const CameraUniform& camera)
    {
        Varyings o{};
        const glm::mat4 model = instance.matrix();
        const glm::vec4 world = transform_point(model, vin.position);
        o.clip = camera.view_proj * world;

        const glm::mat3 m3 = glm::mat3(model);
        const glm::vec3 n_ws = normalize_checked(m3 * vin.normal, "world normal");
        const glm::vec3 t_ws = normalize_checked(m3 * vin.tangent, "world tangent");
        const glm::vec3 b_ws = normalize_checked(m3 * vin.bitangent, "world bitangent");

        o.set(VaryingSemantic::WorldPos, world);
        o.set(VaryingSemantic::UV0, glm::vec4(vin.uv, 0.0f, 0.0f));
        o.set(VaryingSemantic::NormalWS, glm::vec4(n_ws, 0.0f));
        o.set(VaryingSemantic::TangentWS, glm::vec4(t_ws, 0.0f));
        o.set(VaryingSemantic::BitangentWS, glm::vec4(b_ws, 0.0f));
        return o;
    }

    // Mesh-ийн i-р vertex-ийн attribute-уудыг уншина. Tangent basis байхгүй бол default үлдэнэ.
    inline VertexAttributes read_vertex_attributes(const MeshData& mesh, uint32_t i)
    {
        VertexAttributes v{};
        v.position = mesh.positions[(size_t)i];
        if (i < mesh.uvs.size()) v.uv = mesh.uvs[(size_t)i];
        if (i < mesh.normals.size()) v.normal = mesh.normals[(size_t)i];
        if (i < mesh.tangents.size()) v.tangent = mesh.tangents[(size_t)i];
        if (i < mesh.bitangents.size()) v.bitangent = mesh.bitangents[(size_t)i];
        return v;
    }
}
