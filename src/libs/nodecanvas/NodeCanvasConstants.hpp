#pragma once

namespace NodeCanvas::Constants {

inline constexpr char kSceneBackgroundColor[] = "#F0F0F0";

// Grid (world units).
inline constexpr double kGridCellSize = 20.0;
inline constexpr int kGridMajorLineEvery = 5;
inline constexpr char kGridMinorColor[] = "#E6E6E6";
inline constexpr char kGridMajorColor[] = "#C8C8C8";

inline constexpr double kMinZoom = 0.25;
inline constexpr double kMaxZoom = 4.00;
inline constexpr double kZoomStep = 1.25;
inline constexpr double kZoomEpsilon = 1e-9;

// Node geometry and styling.
inline constexpr double kNodeWidth = 150.0;
inline constexpr double kNodeHeight = 100.0;
inline constexpr double kNodeCornerRadius = 10.0;
inline constexpr double kPortRadius = 6.0;
inline constexpr char kNodeOutlineColor[] = "#000000";
inline constexpr char kNodeFillColor[] = "#F0FFF0";
inline constexpr char kNodeSelectedOutlineColor[] = "#FFA500";
inline constexpr char kNodeSelectedFillColor[] = "#FFEBB4";
inline constexpr char kPortFillColor[] = "#19B400";
inline constexpr double kNodeOutlineWidth = 2.0;
inline constexpr double kNodeSelectedOutlineWidth = 5.0;

// Manhattan distance in world units, not scaled by zoom: on screen the hit
// area grows when zooming in and shrinks when zooming out.
inline constexpr double kPortHitThreshold = 15.0;

inline constexpr char kConnectionColor[] = "#141414";
inline constexpr double kConnectionWidth = 2.0;
inline constexpr char kConnectionSelectedColor[] = "#FFA500";
inline constexpr double kConnectionSelectedWidth = 4.0;
inline constexpr double kConnectionHitTolerance = 6.0;
inline constexpr double kConnectionDepth = -1.0;
inline constexpr double kNodeDepth = 0.0;

inline constexpr char kPreviewLineColor[] = "#008000";
inline constexpr double kPreviewLineWidth = 2.0;

inline constexpr char kMarqueeOutlineColor[] = "#3D7EDB";
inline constexpr char kMarqueeFillColor[] = "#333D7EDB";
inline constexpr double kMarqueeDragThresholdPx = 4.0;

// "Add Node" places the top-left corner uniformly inside this range.
inline constexpr int kRandomPlacementMaxX = 500;
inline constexpr int kRandomPlacementMaxY = 200;

} // namespace NodeCanvas::Constants
