#pragma once

// Endpoint annotation.
//
// RESTEP_ENDPOINT ("/customers/{customer_id}", params = "customer_path")
// std::string
// customer_url (const customer_path& p)
// {
//   return base + endpoint (p);
// }
//
// The restep compiler replaces the annotation with a path helper inserted
// at the top of the annotated definition. Without restep the annotation
// expands to nothing (and the helper is missing, of course).
//
#define RESTEP_ENDPOINT(...)
