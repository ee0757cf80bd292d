#include <catch2/catch.hpp>
#include <softpack/manifest.hpp>
#include <softpack/module_translator.hpp>

using namespace softpack;

static const char* kShpcModule = R"MOD(#%Module

#=====
# Created by singularity-hpc (https://github.com/singularityhub/singularity-hpc)
#=====

proc ModulesHelp { } {

    puts stderr "This module is a singularity container wrapper for quay.io/biocontainers/samtools"
    puts stderr ""
    puts stderr "Container (available through variable SINGULARITY_CONTAINER):"
    puts stderr " - \$SINGULARITY_CONTAINER"
}

module-whatis   "Name: quay.io/biocontainers/samtools"
module-whatis   "Version: 1.18--h50ea8bc_1"
module-whatis   "Packages: samtools, htslib bzip2"

set view_dir "[file dirname [file dirname ${ModulesCurrentModulefile}] ]"
)MOD";

TEST_CASE("translate an shpc module", "[module]") {
    std::string yml = to_softpack_yml("samtools", kShpcModule);

    auto m = EnvManifest::parse(yml);
    REQUIRE(m.is_ok());
    REQUIRE(m.value().description ==
            "This module is a singularity container wrapper for quay.io/biocontainers/samtools\n"
            "\n"
            "Container (available through variable SINGULARITY_CONTAINER):\n"
            " - $SINGULARITY_CONTAINER\n");

    const auto& pkgs = m.value().packages;
    REQUIRE(pkgs.size() == 4);
    REQUIRE(pkgs[0].name == "quay.io/biocontainers/samtools");
    REQUIRE(pkgs[0].version == std::string("1.18--h50ea8bc_1"));
    REQUIRE(pkgs[1].to_string() == "samtools");
    REQUIRE(pkgs[2].to_string() == "htslib");
    REQUIRE(pkgs[3].to_string() == "bzip2");
}

TEST_CASE("the declared name is used without a Name line", "[module]") {
    std::string yml = to_softpack_yml("mytool", "module-whatis \"Packages: a\"\n");
    REQUIRE(yml == "description: |\npackages:\n  - mytool\n  - a\n");
}

TEST_CASE("Name line may carry the version", "[module]") {
    std::string yml = to_softpack_yml("x", "module-whatis \"Name: tool:2.1 \"\n");
    REQUIRE(yml.find("  - tool@2.1\n") != std::string::npos);
}

TEST_CASE("an empty Name line is ignored", "[module]") {
    std::string yml = to_softpack_yml("fallback", "module-whatis \"Name:   \"\n");
    REQUIRE(yml.find("  - fallback\n") != std::string::npos);
}

TEST_CASE("puts outside the help block are not description", "[module]") {
    std::string yml = to_softpack_yml("x",
        "puts stderr \"loading\"\n"
        "proc ModulesHelp { } {\n"
        "  puts stderr \"tab\\there\"\n"
        "}\n");
    REQUIRE(yml == "description: |\n  tab\there\npackages:\n  - x\n");
}

TEST_CASE("readme names the module to load", "[module]") {
    auto r = generate_readme("HGI/common/samtools/1.18");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() ==
            "# Usage\n"
            "\n"
            "To use this environment, run:\n"
            "\n"
            "```\n"
            "module load HGI/common/samtools/1.18\n"
            "```\n");
}
