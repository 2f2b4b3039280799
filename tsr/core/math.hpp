#pragma once

#define GLM_FORCE_RADIANS

#include <cstdint>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "panic.hpp"


namespace tsr {


using vec3  = glm::vec3;
using mat4  = glm::mat4;
using ivec3 = glm::ivec3;

} // tsr


namespace tsr::math {


// truncating division fixed up toward negative infinity; exact over the whole int32 range
[[nodiscard]] static inline int32_t floor_div(int32_t value, int32_t divisor)
{
	TSR_ASSERT_MSG(divisor > 0, "[floor div] divisor <= 0");

	const int32_t quotient = value / divisor;
	return quotient - ((value % divisor != 0 && value < 0) ? 1 : 0);
}


[[nodiscard]] static inline int32_t floor_mod(int32_t value, int32_t divisor)
{
	TSR_ASSERT_MSG(divisor > 0, "[floor mod] divisor <= 0");

	const int32_t remainder = value % divisor;
	return remainder < 0 ? remainder + divisor : remainder;
}


// chunk spans extent x extent tiles on the xz plane, y selects the layer
[[nodiscard]] static inline mat4 chunk_model_matrix(ivec3 chunk, int32_t extent, float tile_size)
{
	const float span = static_cast<float>(extent) * tile_size;

	const vec3 origin {
		static_cast<float>(chunk.x) * span,
		static_cast<float>(chunk.y) * tile_size,
		static_cast<float>(chunk.z) * span
	};

	return
		glm::translate(mat4(1.0f), origin) *
		glm::scale(mat4(1.0f), vec3(span, 1.0f, span));
}


} // tsr::math
