module;

#include <bit>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

module Sync;

import Core;
import ECS;

namespace Sync
{
    namespace
    {
        using namespace ECS::Components;

        class Encoder
        {
        public:
            explicit Encoder(Core::Hash::Fnv1a128& hasher) : m_Hasher(hasher) {}

            void Separator()
            {
                m_Hasher.UpdateByte(0x00);
                m_Hasher.UpdateByte(0x1F);
            }

            void Field(std::string_view text)
            {
                m_Hasher.Update(text);
                Separator();
            }

            void Int(int64_t value)
            {
                char buf[24];
                const auto res = std::to_chars(buf, buf + sizeof(buf), value);
                Field(std::string_view(buf, static_cast<size_t>(res.ptr - buf)));
            }

            void Bool(bool value) { Field(value ? "1" : "0"); }

            void FloatText(double value)
            {
                Field(std::format("{:016x}", std::bit_cast<uint64_t>(value)));
            }

            void String(std::string_view text)
            {
                Int(static_cast<int64_t>(text.size()));
                Field(text);
            }

            void Raw(double value)
            {
                uint64_t bits = std::bit_cast<uint64_t>(value);
                for (int i = 0; i < 8; ++i)
                {
                    m_Hasher.UpdateByte(static_cast<uint8_t>(bits & 0xffu));
                    bits >>= 8;
                }
            }

        private:
            Core::Hash::Fnv1a128& m_Hasher;
        };

        void EncodeSettings(Encoder& enc, const Curve::Settings& s)
        {
            enc.Field(s.Dims == Curve::Dimensions::TwoD ? "2D" : "3D");
            enc.Int(s.ResolutionU);
            enc.Int(s.ResolutionV);
            enc.Int(s.RenderResolutionU);
            enc.Int(s.RenderResolutionV);
            enc.FloatText(s.BevelDepth);
            enc.Int(s.BevelResolution);
            enc.FloatText(s.Extrude);
            enc.FloatText(s.Offset);
            enc.FloatText(s.TwistSmooth);
            enc.Bool(s.FillCaps);
            enc.Bool(s.FillDeform);
        }

        void EncodePoint(Encoder& enc, const Curve::Point& p)
        {
            enc.Raw(p.Co.x);
            enc.Raw(p.Co.y);
            enc.Raw(p.Co.z);
            enc.Raw(p.Co.w);
            enc.Raw(p.Tilt);
            enc.Raw(p.Radius);
        }

        void EncodeSpline(Encoder& enc, const Curve::Spline& spline)
        {
            enc.Field(Curve::SplineTypeName(spline.Type));
            enc.Bool(spline.CyclicU);
            enc.Bool(spline.CyclicV);
            enc.Int(spline.OrderU);
            enc.Int(spline.OrderV);
            enc.Int(spline.ResolutionU);
            enc.Int(spline.ResolutionV);
            enc.Int(static_cast<int64_t>(spline.PointCount()));

            switch (spline.Type)
            {
            case Curve::SplineType::Bezier:
                for (const Curve::BezierPoint& p : spline.BezierPoints)
                {
                    for (const glm::dvec3* v : {&p.HandleLeft, &p.Co, &p.HandleRight})
                    {
                        enc.Raw(v->x);
                        enc.Raw(v->y);
                        enc.Raw(v->z);
                    }
                    enc.Raw(p.Tilt);
                    enc.Raw(p.Radius);
                }
                break;
            case Curve::SplineType::Surface:
            {
                enc.Int(spline.PointsU);
                const size_t rowSize = spline.PointsU > 0 ? static_cast<size_t>(spline.PointsU)
                                                          : spline.Points.size();
                for (size_t i = 0; i < spline.Points.size(); ++i)
                {
                    EncodePoint(enc, spline.Points[i]);
                    if ((i + 1) % rowSize == 0 || i + 1 == spline.Points.size())
                        enc.Separator();
                }
                break;
            }
            case Curve::SplineType::Poly:
            case Curve::SplineType::Nurbs:
                for (const Curve::Point& p : spline.Points)
                    EncodePoint(enc, p);
                break;
            }
        }

        void EncodeValue(Encoder& enc, const ECS::Scene& scene, const Modifiers::ParamValue& value)
        {
            std::visit([&](const auto& v)
            {
                using T = std::decay_t<decltype(v)>;

                if constexpr (std::is_same_v<T, double>)
                {
                    enc.Field("f");
                    enc.Raw(v);
                    enc.Separator();
                }
                else if constexpr (std::is_same_v<T, int64_t>)
                {
                    enc.Field("i");
                    enc.Int(v);
                }
                else if constexpr (std::is_same_v<T, bool>)
                {
                    enc.Field("b");
                    enc.Bool(v);
                }
                else if constexpr (std::is_same_v<T, std::string>)
                {
                    enc.Field("s");
                    enc.String(v);
                }
                else if constexpr (std::is_same_v<T, entt::entity>)
                {
                    enc.Field("r");
                    enc.String(scene.GetName(v));
                }
                else if constexpr (std::is_same_v<T, Modifiers::EntityList>)
                {
                    enc.Field("l");
                    enc.Int(static_cast<int64_t>(v.Items.size()));
                    for (entt::entity item : v.Items)
                        enc.String(scene.GetName(item));
                }
            }, value);
        }

        // Numeric values follow the declared kind, so 3 and 3.0 hash alike.
        void EncodeDeclared(Encoder& enc, const ECS::Scene& scene, ParamKind kind,
                            const Modifiers::ParamValue& value)
        {
            if (kind == ParamKind::Float)
            {
                if (const auto* i = std::get_if<int64_t>(&value))
                {
                    EncodeValue(enc, scene, Modifiers::ParamValue{static_cast<double>(*i)});
                    return;
                }
            }
            else if (kind == ParamKind::Int)
            {
                constexpr double kLimit = 9.2e18;
                const auto* d = std::get_if<double>(&value);
                if (d && std::trunc(*d) == *d && std::abs(*d) < kLimit)
                {
                    EncodeValue(enc, scene, Modifiers::ParamValue{static_cast<int64_t>(*d)});
                    return;
                }
            }
            EncodeValue(enc, scene, value);
        }

        void EncodeModifier(Encoder& enc, const ECS::Scene& scene, const Modifiers::Modifier& mod,
                            const ModifierSchemaTable& schemas)
        {
            enc.String(mod.Type);
            enc.Bool(mod.ShowViewport);
            enc.Bool(mod.ShowRender);

            const ModifierSchema* schema = schemas.Find(mod.Type);
            if (schema)
            {
                enc.Int(static_cast<int64_t>(schema->Params.size()));
                for (const ParamDescriptor& param : schema->Params)
                {
                    enc.String(param.Name);
                    if (const Modifiers::ParamValue* value = mod.Find(param.Name))
                        EncodeDeclared(enc, scene, param.Kind, *value);
                    else
                        enc.Field("u");
                }
            }

            // Stored parameters the schema does not declare (all of them for an
            // unknown kind), already ordered by name.
            std::vector<const std::pair<const std::string, Modifiers::ParamValue>*> extra;
            for (const auto& entry : mod.Params)
            {
                if (ModifierSchemaTable::IsUiOnly(entry.first))
                    continue;
                if (schema && schema->Declares(entry.first))
                    continue;
                extra.push_back(&entry);
            }

            enc.Int(static_cast<int64_t>(extra.size()));
            for (const auto* entry : extra)
            {
                enc.String(entry->first);
                EncodeValue(enc, scene, entry->second);
            }
        }
    }

    bool IsCurveSource(const ECS::Scene& scene, entt::entity entity)
    {
        const auto& registry = scene.GetRegistry();
        if (!registry.valid(entity))
            return false;

        const auto* source = registry.try_get<SourceObject::Component>(entity);
        if (!source || !registry.valid(source->Data))
            return false;
        return registry.all_of<Curve::Component>(source->Data);
    }

    std::optional<Core::Hash::Digest128>
    Fingerprint(const ECS::Scene& scene, entt::entity source, const ModifierSchemaTable& schemas)
    {
        if (!IsCurveSource(scene, source))
            return std::nullopt;

        const auto& registry = scene.GetRegistry();
        const auto& data = registry.get<Curve::Component>(registry.get<SourceObject::Component>(source).Data);

        Core::Hash::Fnv1a128 hasher;
        Encoder enc(hasher);

        EncodeSettings(enc, data.Tessellation);

        enc.Int(static_cast<int64_t>(data.Splines.size()));
        for (const Curve::Spline& spline : data.Splines)
            EncodeSpline(enc, spline);

        const auto* stack = registry.try_get<Modifiers::Component>(source);
        enc.Int(stack ? static_cast<int64_t>(stack->Stack.size()) : 0);
        if (stack)
        {
            for (const Modifiers::Modifier& mod : stack->Stack)
                EncodeModifier(enc, scene, mod, schemas);
        }

        return hasher.Finish();
    }
}
