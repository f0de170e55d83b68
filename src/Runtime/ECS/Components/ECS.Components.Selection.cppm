module;

export module ECS:Components.Selection;

export namespace ECS::Components::Selection
{
    // Tag: the entity is currently selected.
    struct SelectedTag {};

    // Tag: the entity is the active object of the selection.
    struct ActiveTag {};
}

export namespace ECS::Components::Visibility
{
    // Tag: hidden in the viewport. Has no bearing on evaluation.
    struct HiddenTag {};
}
