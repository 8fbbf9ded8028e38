export module Input;

export import :Types;
export import :ActionMap;
export import :Arbiter;
export import :Events;
export import :Router;
export import :Source;
export import :ScriptedSource;
export import :System;
