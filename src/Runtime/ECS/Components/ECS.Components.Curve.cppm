module;
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include <glm/glm.hpp>

export module ECS:Components.Curve;

// -------------------------------------------------------------------------
// Curve data block
// -------------------------------------------------------------------------
// Lives on its own entity so several source objects can share one block.
// Coordinates are stored in double precision: they are the authoring data,
// not render data, and the fingerprint hashes their exact bit patterns.
// -------------------------------------------------------------------------

export namespace ECS::Components::Curve
{
    enum class SplineType : uint8_t
    {
        Poly,
        Bezier,
        Nurbs,
        Surface // NURBS patch: Points holds PointsU columns per row, row-major.
    };

    [[nodiscard]] constexpr std::string_view SplineTypeName(SplineType type)
    {
        switch (type)
        {
        case SplineType::Poly:    return "POLY";
        case SplineType::Bezier:  return "BEZIER";
        case SplineType::Nurbs:   return "NURBS";
        case SplineType::Surface: return "SURFACE";
        }
        return "UNKNOWN";
    }

    enum class Dimensions : uint8_t
    {
        TwoD,
        ThreeD
    };

    struct BezierPoint
    {
        glm::dvec3 HandleLeft{0.0};
        glm::dvec3 Co{0.0};
        glm::dvec3 HandleRight{0.0};
        double Tilt = 0.0;
        double Radius = 1.0;
    };

    // Homogeneous control point; w is the NURBS weight (1 for Poly).
    struct Point
    {
        glm::dvec4 Co{0.0, 0.0, 0.0, 1.0};
        double Tilt = 0.0;
        double Radius = 1.0;
    };

    struct Spline
    {
        SplineType Type = SplineType::Poly;
        bool CyclicU = false;
        bool CyclicV = false;
        int OrderU = 4;
        int OrderV = 4;
        int ResolutionU = 12;
        int ResolutionV = 12;

        std::vector<BezierPoint> BezierPoints; // Bezier only
        std::vector<Point> Points;             // Poly, Nurbs, Surface
        int PointsU = 0;                       // Surface only: points per row

        [[nodiscard]] size_t PointCount() const
        {
            return Type == SplineType::Bezier ? BezierPoints.size() : Points.size();
        }
    };

    // Curve-wide tessellation settings.
    struct Settings
    {
        Dimensions Dims = Dimensions::ThreeD;
        int ResolutionU = 12;
        int ResolutionV = 12;
        int RenderResolutionU = 0;
        int RenderResolutionV = 0;
        double BevelDepth = 0.0;
        int BevelResolution = 4;
        double Extrude = 0.0;
        double Offset = 1.0;
        double TwistSmooth = 0.0;
        bool FillCaps = false;
        bool FillDeform = true;
    };

    struct Component
    {
        Settings Tessellation;
        std::vector<Spline> Splines;
    };
}
