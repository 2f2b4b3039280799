#include "resource_forge.hpp"

#include "host_forge.hpp"
#include "sokol_forge.hpp"


namespace tsr::rdr {


std::unique_ptr<ResourceForge> make_forge(ForgeBackend backend)
{
	switch (backend) {
	case ForgeBackend::host:  return std::make_unique<HostForge>();
	case ForgeBackend::sokol: return std::make_unique<SokolForge>();
	}
	return std::make_unique<HostForge>();
}


const char* forge_backend_name(ForgeBackend backend)
{
	switch (backend) {
	case ForgeBackend::host:  return "host";
	case ForgeBackend::sokol: return "sokol";
	}
	return "unknown";
}


} // tsr::rdr
