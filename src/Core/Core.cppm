export module Core;

// Re-export the ambient modules so users only need 'import Core;'
export import Core.Logging;
export import Core.Error;
