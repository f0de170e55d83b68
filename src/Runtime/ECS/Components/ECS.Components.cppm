module;

export module ECS:Components;
export import :Components.NameTag;
export import :Components.Transform;
export import :Components.Selection;
export import :Components.Curve;
export import :Components.Modifiers;
export import :Components.SourceObject;
export import :Components.MeshLink;
