#pragma once

#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtCore/QHashFunctions>
#include <QtCore/QtGlobal>

namespace NodeCanvas {

template <typename Tag>
class StrongId final
{
public:
	using value_type = quint64;

	constexpr StrongId() = default;
	explicit constexpr StrongId(value_type v) : m_value(v) {}

	constexpr value_type value() const { return m_value; }
	constexpr bool isValid() const { return m_value != 0; }

	explicit operator bool() const { return isValid(); }

	friend constexpr bool operator==(StrongId a, StrongId b) { return a.m_value == b.m_value; }
	friend constexpr bool operator!=(StrongId a, StrongId b) { return a.m_value != b.m_value; }
	friend constexpr bool operator<(StrongId a, StrongId b) { return a.m_value < b.m_value; }

private:
	value_type m_value = 0;
};

struct NodeIdTag {};
struct ConnectionIdTag {};

using NodeId = StrongId<NodeIdTag>;
using ConnectionId = StrongId<ConnectionIdTag>;

enum class PortKind : quint8 {
	Input,
	Output
};

#define DEFINE_QHASH_OVERLOAD(Id) \
inline size_t qHash(Id id, size_t seed = 0) noexcept {  \
	return ::qHash(id.value(), seed);				\
}

DEFINE_QHASH_OVERLOAD(NodeCanvas::NodeId)
DEFINE_QHASH_OVERLOAD(NodeCanvas::ConnectionId)

#undef DEFINE_QHASH_OVERLOAD

} // namespace NodeCanvas
