export module Sync;

export import :Errors;
export import :Config;
export import :Events;
export import :Evaluation;
export import :Report;
export import :ModifierSchema;
export import :Fingerprint;
export import :LinkRegistry;
export import :ChangeDetector;
export import :DebounceScheduler;
export import :ArtifactBuilder;
export import :ArtifactSwapper;
export import :EventRouter;
export import :MeshSyncSystem;
