#include <cassert>
#include <iostream>

#include "application/IntentClassifier.hpp"

using webforge::application::Classification;
using webforge::application::IntentClassifier;
using webforge::domain::Intent;

namespace {

IntentClassifier::ComponentMap Components() {
    return {
        {"Hero", "<section><h1>Fresh bread</h1><button>Order</button><button>Menu</button></section>"},
        {"Navbar", "<nav><a href=\"#\">Home</a><button>Call</button></nav>"},
        {"Pricing", "<section><ul><li>Loaf</li></ul></section>"},
        {"Footer", "<footer>(c) Bakery</footer>"},
    };
}

void TestEmptyInstruction() {
    std::cout << "[Test] Empty instructions are not classified..." << std::endl;
    assert(!IntentClassifier::Classify("", Components()));
    assert(!IntentClassifier::Classify("   \n\t", Components()));
    std::cout << "[PASS] nullopt for empty text." << std::endl;
}

void TestFeature() {
    std::cout << "[Test] Addition requests become features..." << std::endl;
    auto result = IntentClassifier::Classify("Add a testimonials section", Components());
    assert(result);
    assert(result->intent == Intent::Feature);
    assert(result->targetComponent == "Testimonials");
    assert(result->targetIsNew);

    auto unknownRef = IntentClassifier::Classify("Put the ContactForm under the footer", Components());
    assert(unknownRef && unknownRef->intent == Intent::Feature);
    assert(unknownRef->targetComponent == "ContactForm" && unknownRef->targetIsNew);

    assert(IntentClassifier::DeriveNewComponentName("add a new photo gallery with lightbox") == "PhotoGallery");
    assert(IntentClassifier::DeriveNewComponentName("please tidy things up") == "NewSection");
    std::cout << "[PASS] Feature intent with derived names." << std::endl;
}

void TestPatch() {
    std::cout << "[Test] Surface edits become patches..." << std::endl;
    auto result = IntentClassifier::Classify("Change the text color of the hero to white", Components());
    assert(result && result->intent == Intent::Patch);
    assert(result->targetComponent == "Hero");
    assert(!result->targetIsNew);

    auto hinted = IntentClassifier::Classify("make it pop", Components(), std::string("navbar"));
    assert(hinted && hinted->intent == Intent::Patch);
    assert(hinted->targetComponent == "Navbar");

    assert(IntentClassifier::HasPatchSignal("set the padding to 24"));
    assert(!IntentClassifier::HasPatchSignal("redesign the layout"));
    std::cout << "[PASS] Patch intent on an existing component." << std::endl;
}

void TestModify() {
    std::cout << "[Test] Everything else is a modify..." << std::endl;
    auto result = IntentClassifier::Classify("Redesign the pricing cards as a comparison grid", Components());
    assert(result && result->intent == Intent::Modify);
    assert(result->targetComponent == "Pricing");

    auto byContent = IntentClassifier::Classify("Give the buttons rounded corners", Components());
    assert(byContent && byContent->intent == Intent::Modify);
    assert(byContent->targetComponent == "Hero");

    auto noComponents = IntentClassifier::Classify("Redesign everything", {});
    assert(noComponents && noComponents->intent == Intent::Modify);
    assert(noComponents->targetComponent.empty());
    std::cout << "[PASS] Modify intent targets an existing component." << std::endl;
}

void TestOverride() {
    std::cout << "[Test] Intent chosen by the client..." << std::endl;
    Classification forced = IntentClassifier::ResolveFor(Intent::Feature, "something", Components(), std::string("Gallery"));
    assert(forced.intent == Intent::Feature);
    assert(forced.targetComponent == "Gallery" && forced.targetIsNew);

    Classification existing = IntentClassifier::ResolveFor(Intent::Modify, "tweak the footer", Components());
    assert(existing.targetComponent == "Footer");
    std::cout << "[PASS] Override keeps the requested intent." << std::endl;
}

void TestDeterminism() {
    std::cout << "[Test] Same input, same output..." << std::endl;
    for (int i = 0; i < 20; ++i) {
        auto a = IntentClassifier::Classify("Add a new FAQ block", Components());
        auto b = IntentClassifier::Classify("Add a new FAQ block", Components());
        assert(a && b);
        assert(a->intent == b->intent && a->targetComponent == b->targetComponent);
    }
    std::cout << "[PASS] Deterministic." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] IntentClassifier" << std::endl;
    TestEmptyInstruction();
    TestFeature();
    TestPatch();
    TestModify();
    TestOverride();
    TestDeterminism();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
